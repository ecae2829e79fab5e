#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "TestUtils.hpp"
#include <string>
#include <vector>

using sealstream::PlaintextRelease;
using sealstream::SealParameterSpec;
using sealstream::Sealer;
using namespace sealstream::test;

TEST_CASE("Seal and open round trip", "[e2e]") {
    const size_t length = GENERATE(0, 1, 15, 16, 17, 4095, 4096, 200000);
    const auto header = GENERATE(std::string(""), std::string("h"), std::string(300, 'x'));

    const Sealer sealer(SealParameterSpec::AES256CTR_SHA3_256_128K);
    const auto headerBytes = createTestHeader(header);
    const auto plaintext = randomBytes(length);

    const auto sealed = sealAll(sealer, plaintext, headerBytes);
    REQUIRE(sealed.size() == headerBytes.size() + length + SealParameterSpec::TAG_SIZE);
    REQUIRE(openAll(sealer, split(sealed, {4097}), headerBytes) == plaintext);
}

TEST_CASE("1-byte and 128 KiB chunks give the same plaintext and verification", "[e2e]") {
    const Sealer tiny(createParameterSpec(1));
    const Sealer large(SealParameterSpec::AES256CTR_SHA3_256_128K);
    const auto header = createTestHeader();
    const auto plaintext = randomBytes(3000);

    auto tinyPipeline = tiny.createDecryptPipeline(createTestMacKey(), createTestCipherKey(), createTestIv(), header);
    auto largePipeline = large.createDecryptPipeline(createTestMacKey(), createTestCipherKey(), createTestIv(), header);

    REQUIRE(tinyPipeline.run({sealAll(tiny, plaintext, header)}) == plaintext);
    REQUIRE(largePipeline.run({sealAll(large, plaintext, header)}) == plaintext);

    const auto& tinyDecryptor = dynamic_cast<const sealstream::SealDecryptor&>(tinyPipeline.stage(2));
    const auto& largeDecryptor = dynamic_cast<const sealstream::SealDecryptor&>(largePipeline.stage(2));
    REQUIRE(tinyDecryptor.isVerified());
    REQUIRE(largeDecryptor.isVerified());
}

TEST_CASE("Empty payload seals to header and tag and opens to nothing", "[e2e]") {
    const Sealer sealer(SealParameterSpec::AES256CTR_SHA3_256_128K);
    const auto header = createTestHeader();

    const auto sealed = sealAll(sealer, {}, header);
    REQUIRE(sealed.size() == header.size() + 32);

    auto pipeline = sealer.createDecryptPipeline(createTestMacKey(), createTestCipherKey(), createTestIv(), header);
    REQUIRE(pipeline.run({sealed}).empty());
    REQUIRE(dynamic_cast<const sealstream::SealDecryptor&>(pipeline.stage(2)).isVerified());
}

TEST_CASE("Decryption must use the encryption chunk size", "[e2e]") {
    const auto header = createTestHeader();
    const auto plaintext = randomBytes(100);
    const auto sealed = sealAll(Sealer(createParameterSpec(17)), plaintext, header);

    // Same tag, but the counter advances differently from the second chunk on.
    const auto opened = openAll(Sealer(createParameterSpec(16)), {sealed}, header);
    REQUIRE(opened.size() == plaintext.size());
    REQUIRE(opened != plaintext);
}

TEST_CASE("Round trip with a SHA3-512 tag and withheld plaintext", "[e2e]") {
    const SealParameterSpec spec(
        sealstream::Cipher::fromType(sealstream::CipherType::AES_256_CTR),
        sealstream::Digest::fromType(sealstream::DigestType::SHA3_512),
        1024, 0, PlaintextRelease::AfterVerification);
    const Sealer sealer(spec);
    const auto header = createTestHeader();
    const auto plaintext = randomBytes(5000);

    const auto sealed = sealAll(sealer, plaintext, header);
    REQUIRE(sealed.size() == header.size() + plaintext.size() + SealParameterSpec::TAG_SIZE);
    REQUIRE(openAll(sealer, split(sealed, {333}), header) == plaintext);

    auto tampered = sealed;
    tampered[header.size() + 4000] ^= 0x04;
    REQUIRE_THROWS_AS(openAll(sealer, {tampered}, header), sealstream::AuthenticationException);
}

TEST_CASE("Different IVs give different ciphertexts", "[e2e]") {
    const Sealer sealer(SealParameterSpec::AES256CTR_SHA3_256_128K);
    const auto header = createTestHeader();
    const auto plaintext = randomBytes(64);

    auto first = sealer.createEncryptPipeline(createTestMacKey(), createTestCipherKey(), createTestIv(0), header);
    auto second = sealer.createEncryptPipeline(createTestMacKey(), createTestCipherKey(), createTestIv(1), header);

    REQUIRE(first.run({plaintext}) != second.run({plaintext}));
}
