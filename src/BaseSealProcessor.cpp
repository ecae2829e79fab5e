#include "BaseSealProcessor.hpp"
#include "MacKey.hpp"
#include "ProcessingGuard.hpp"
#include "sealstream/CipherKey.hpp"
#include "sealstream/CipherProvider.hpp"
#include "sealstream/DigestProvider.hpp"
#include "sealstream/Logger.hpp"
#include "sealstream/SealException.hpp"
#include <string>
#include <utility>

namespace sealstream {

namespace {

std::vector<uint8_t> checkedCopy(const std::span<const uint8_t> bytes, const size_t expected, const char* what) {
    if (bytes.size() != expected) {
        throw InvalidParametersException(std::string("invalid ") + what + " length, expected " +
                                         std::to_string(expected) + ", got " + std::to_string(bytes.size()));
    }
    return {bytes.begin(), bytes.end()};
}

}

BaseSealProcessor::~BaseSealProcessor() = default;

BaseSealProcessor::BaseSealProcessor(
    const SealParameterSpec& parameterSpec,
    std::shared_ptr<CipherProvider> cipherProvider,
    std::shared_ptr<DigestProvider> digestProvider,
    const std::span<const uint8_t> macKey,
    const std::span<const uint8_t> cipherKey,
    const std::span<const uint8_t> iv,
    const std::span<const uint8_t> header)
    : parameterSpec_(parameterSpec),
      iv_(checkedCopy(iv, SealParameterSpec::IV_SIZE, "IV")),
      header_(header.begin(), header.end()),
      cipherProvider_(std::move(cipherProvider)),
      digestProvider_(std::move(digestProvider)),
      state_(TransformState::Init),
      busy_(false) {

    if (!cipherProvider_ || !digestProvider_) {
        throw InvalidParametersException("cipher and digest providers are required");
    }

    macKey_ = std::make_unique<MacKey>(checkedCopy(macKey, SealParameterSpec::KEY_SIZE, "MAC key"));
    cipherKey_ = std::make_unique<CipherKey>(
        checkedCopy(cipherKey, parameterSpec.getCipher().getKeyLength(), "cipher key"),
        parameterSpec.getCipher().getAlgorithmName());
}

void BaseSealProcessor::processInternal(
    const TransformState requiredState, const std::function<void()>& processFunc) {

    assertState(requiredState);
    ProcessingGuard guard(busy_);
    try {
        processFunc();
    } catch (const CryptoPrimitiveException& e) {
        Logger::getInstance().log(LogLevel::Error, std::string("crypto primitive failure: ") + e.what());
        fail();
        throw;
    } catch (const SealException&) {
        fail();
        throw;
    } catch (const std::exception& e) {
        fail();
        throw SealException(e);
    }
    if (state_ == TransformState::Cancelled) {
        releaseResources();
    }
}

void BaseSealProcessor::primeDigest() {
    if (!checkpoint()) {
        return;
    }
    try {
        digest_ = digestProvider_->createAccumulator();
    } catch (const SealException&) {
        throw;
    } catch (const std::exception& e) {
        throw CryptoPrimitiveException("digest initialization failed", e);
    }
    if (!digest_) {
        throw CryptoPrimitiveException("digest provider returned no accumulator");
    }
    absorb(macKey_->getKeyData());
    absorb(header_);
    state_ = TransformState::Processing;
}

bool BaseSealProcessor::checkpoint() {
    return state_ != TransformState::Cancelled;
}

void BaseSealProcessor::absorb(const std::span<const uint8_t> data) {
    try {
        digest_->absorb(data.data(), data.size());
    } catch (const SealException&) {
        throw;
    } catch (const std::exception& e) {
        throw CryptoPrimitiveException("digest update failed", e);
    }
}

std::vector<uint8_t> BaseSealProcessor::encryptChunk(const CounterIv& iv, const std::span<const uint8_t> plaintext) {
    std::vector<uint8_t> ciphertext;
    try {
        ciphertext = cipherProvider_->encrypt(*cipherKey_, iv, plaintext.data(), plaintext.size());
    } catch (const SealException&) {
        throw;
    } catch (const std::exception& e) {
        throw CryptoPrimitiveException("encryption failed", e);
    }
    if (ciphertext.size() != plaintext.size()) {
        throw CryptoPrimitiveException("cipher changed the data length, expected " +
                                       std::to_string(plaintext.size()) + ", got " +
                                       std::to_string(ciphertext.size()));
    }
    return ciphertext;
}

std::vector<uint8_t> BaseSealProcessor::decryptChunk(const CounterIv& iv, const std::span<const uint8_t> ciphertext) {
    std::vector<uint8_t> plaintext;
    try {
        plaintext = cipherProvider_->decrypt(*cipherKey_, iv, ciphertext.data(), ciphertext.size());
    } catch (const SealException&) {
        throw;
    } catch (const std::exception& e) {
        throw CryptoPrimitiveException("decryption failed", e);
    }
    if (plaintext.size() != ciphertext.size()) {
        throw CryptoPrimitiveException("cipher changed the data length, expected " +
                                       std::to_string(ciphertext.size()) + ", got " +
                                       std::to_string(plaintext.size()));
    }
    return plaintext;
}

std::vector<uint8_t> BaseSealProcessor::computeTag() {
    std::vector<uint8_t> digest;
    try {
        digest = digest_->finalize();
    } catch (const SealException&) {
        throw;
    } catch (const std::exception& e) {
        throw CryptoPrimitiveException("digest finalization failed", e);
    }
    if (digest.size() < SealParameterSpec::TAG_SIZE) {
        throw CryptoPrimitiveException("digest too short for tag, expected at least " +
                                       std::to_string(SealParameterSpec::TAG_SIZE) + ", got " +
                                       std::to_string(digest.size()));
    }
    digest.resize(SealParameterSpec::TAG_SIZE);
    return digest;
}

void BaseSealProcessor::cancelInternal() {
    if (state_ == TransformState::Finalized || state_ == TransformState::Failed ||
        state_ == TransformState::Cancelled) {
        return;
    }
    state_ = TransformState::Cancelled;
    Logger::getInstance().log(LogLevel::Warn, "stream cancelled before completion");
    if (!busy_) {
        releaseResources();
    }
}

void BaseSealProcessor::finalizeInternal() {
    state_ = TransformState::Finalized;
    releaseResources();
}

void BaseSealProcessor::releaseResources() {
    digest_.reset();
    macKey_.reset();
    cipherKey_.reset();
}

void BaseSealProcessor::assertState(const TransformState requiredState) const {
    if (state_ != requiredState) {
        throw SealException(std::string("stream is ") + toString(state_) + ", expected " +
                            toString(requiredState));
    }
}

void BaseSealProcessor::fail() {
    state_ = TransformState::Failed;
    releaseResources();
}

}
