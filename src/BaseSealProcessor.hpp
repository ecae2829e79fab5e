#pragma once

#include "sealstream/CounterIv.hpp"
#include "sealstream/SealParameterSpec.hpp"
#include "sealstream/StreamTransform.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace sealstream {

class CipherProvider;
class DigestProvider;
class DigestAccumulator;
class CipherKey;
class MacKey;

// Key, IV and digest bookkeeping shared by the encrypt and decrypt transforms.
// Every call into the cipher or digest provider goes through this class so that
// cancellation is observed before each one and provider errors end the stream.
class BaseSealProcessor {
public:
    virtual ~BaseSealProcessor();

protected:
    BaseSealProcessor(
        const SealParameterSpec& parameterSpec,
        std::shared_ptr<CipherProvider> cipherProvider,
        std::shared_ptr<DigestProvider> digestProvider,
        std::span<const uint8_t> macKey,
        std::span<const uint8_t> cipherKey,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> header);

    // Runs processFunc if the transform is in `requiredState`. Any exception moves the
    // transform to Failed; exceptions that are not SealExceptions are wrapped.
    void processInternal(TransformState requiredState, const std::function<void()>& processFunc);

    // Creates the digest accumulator and absorbs MAC key then header.
    void primeDigest();

    // False once the stream has been cancelled. Checked before every primitive call.
    [[nodiscard]] bool checkpoint();

    void absorb(std::span<const uint8_t> data);
    [[nodiscard]] std::vector<uint8_t> encryptChunk(const CounterIv& iv, std::span<const uint8_t> plaintext);
    [[nodiscard]] std::vector<uint8_t> decryptChunk(const CounterIv& iv, std::span<const uint8_t> ciphertext);

    // Final digest value truncated to TAG_SIZE.
    [[nodiscard]] std::vector<uint8_t> computeTag();

    void cancelInternal();
    void finalizeInternal();

    // Drops keys, digest state and anything the subclass buffers.
    virtual void releaseResources();

    [[nodiscard]] TransformState getStateInternal() const { return state_; }

    SealParameterSpec parameterSpec_;
    CounterIv iv_;
    std::vector<uint8_t> header_;

private:
    void assertState(TransformState requiredState) const;
    void fail();

    std::shared_ptr<CipherProvider> cipherProvider_;
    std::shared_ptr<DigestProvider> digestProvider_;
    std::unique_ptr<MacKey> macKey_;
    std::unique_ptr<CipherKey> cipherKey_;
    std::unique_ptr<DigestAccumulator> digest_;
    TransformState state_;
    bool busy_;
};

}
