#include "sealstream/Sealer.hpp"
#include "sealstream/Chunker.hpp"
#include "sealstream/CipherProvider.hpp"
#include "sealstream/DigestProvider.hpp"
#include "sealstream/SealException.hpp"
#include "SealEncryptorImpl.hpp"
#include "SealDecryptorImpl.hpp"
#include "HeaderVerifier.hpp"
#include <utility>

namespace sealstream {

Sealer::~Sealer() = default;

Sealer::Sealer(const SealParameterSpec& parameterSpec)
    : Sealer(parameterSpec,
             parameterSpec.getCipher().getCipherProvider(),
             parameterSpec.getDigest().getDigestProvider()) {
}

Sealer::Sealer(
    const SealParameterSpec& parameterSpec,
    std::shared_ptr<CipherProvider> cipherProvider,
    std::shared_ptr<DigestProvider> digestProvider)
    : parameterSpec_(parameterSpec),
      cipherProvider_(std::move(cipherProvider)),
      digestProvider_(std::move(digestProvider)) {

    if (!cipherProvider_ || !digestProvider_) {
        throw InvalidParametersException("cipher and digest providers are required");
    }
}

std::unique_ptr<SealEncryptor> Sealer::createEncryptor(
    const std::span<const uint8_t> macKey,
    const std::span<const uint8_t> cipherKey,
    const std::span<const uint8_t> iv,
    const std::span<const uint8_t> header) const {

    return std::make_unique<SealEncryptorImpl>(
        parameterSpec_, cipherProvider_, digestProvider_, macKey, cipherKey, iv, header);
}

std::unique_ptr<SealDecryptor> Sealer::createDecryptor(
    const std::span<const uint8_t> macKey,
    const std::span<const uint8_t> cipherKey,
    const std::span<const uint8_t> iv,
    const std::span<const uint8_t> header) const {

    return std::make_unique<SealDecryptorImpl>(
        parameterSpec_, cipherProvider_, digestProvider_, macKey, cipherKey, iv, header);
}

std::unique_ptr<Chunker> Sealer::createChunker() const {
    return std::make_unique<Chunker>(parameterSpec_.getChunkSize(), parameterSpec_.getOffset());
}

StreamPipeline Sealer::createEncryptPipeline(
    const std::span<const uint8_t> macKey,
    const std::span<const uint8_t> cipherKey,
    const std::span<const uint8_t> iv,
    const std::span<const uint8_t> header) const {

    StreamPipeline pipeline;
    pipeline.then(createChunker())
            .then(createEncryptor(macKey, cipherKey, iv, header));
    return pipeline;
}

StreamPipeline Sealer::createDecryptPipeline(
    const std::span<const uint8_t> macKey,
    const std::span<const uint8_t> cipherKey,
    const std::span<const uint8_t> iv,
    const std::span<const uint8_t> header) const {

    StreamPipeline pipeline;
    pipeline.then(std::make_unique<HeaderVerifier>(header))
            .then(std::make_unique<Chunker>(parameterSpec_.getChunkSize()))
            .then(createDecryptor(macKey, cipherKey, iv, header));
    return pipeline;
}

}
