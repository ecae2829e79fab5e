#pragma once

#include "sealstream/SealParameterSpec.hpp"
#include "sealstream/StreamPipeline.hpp"
#include <cstdint>
#include <memory>
#include <span>

namespace sealstream {

class CipherProvider;
class DigestProvider;
class Chunker;
class SealEncryptor;
class SealDecryptor;

// Creates encrypt and decrypt transforms for one parameter spec.
// Keys, IVs and headers are copied; nothing passed in is referenced afterwards.
class Sealer {
public:
    explicit Sealer(const SealParameterSpec& parameterSpec);

    Sealer(const SealParameterSpec& parameterSpec,
           std::shared_ptr<CipherProvider> cipherProvider,
           std::shared_ptr<DigestProvider> digestProvider);

    ~Sealer();

    [[nodiscard]] const SealParameterSpec& getParameterSpec() const { return parameterSpec_; }

    // Throws InvalidParametersException when a key or the IV has the wrong length.
    [[nodiscard]] std::unique_ptr<SealEncryptor> createEncryptor(
        std::span<const uint8_t> macKey,
        std::span<const uint8_t> cipherKey,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> header) const;

    [[nodiscard]] std::unique_ptr<SealDecryptor> createDecryptor(
        std::span<const uint8_t> macKey,
        std::span<const uint8_t> cipherKey,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> header) const;

    // Chunker with the configured chunk size and offset.
    [[nodiscard]] std::unique_ptr<Chunker> createChunker() const;

    // Chunker -> encryptor. Input is plaintext, output is header || ciphertext || tag.
    [[nodiscard]] StreamPipeline createEncryptPipeline(
        std::span<const uint8_t> macKey,
        std::span<const uint8_t> cipherKey,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> header) const;

    // Header check -> chunker -> decryptor. Input is header || ciphertext || tag. The leading
    // header bytes must equal `header`, otherwise the stream fails with AuthenticationException.
    [[nodiscard]] StreamPipeline createDecryptPipeline(
        std::span<const uint8_t> macKey,
        std::span<const uint8_t> cipherKey,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> header) const;

private:
    SealParameterSpec parameterSpec_;
    std::shared_ptr<CipherProvider> cipherProvider_;
    std::shared_ptr<DigestProvider> digestProvider_;
};

}
