#pragma once

#include "sealstream/SealDecryptor.hpp"
#include "BaseSealProcessor.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace sealstream {

class SealDecryptorImpl : public SealDecryptor, public BaseSealProcessor {
public:
    SealDecryptorImpl(
        const SealParameterSpec& parameterSpec,
        std::shared_ptr<CipherProvider> cipherProvider,
        std::shared_ptr<DigestProvider> digestProvider,
        std::span<const uint8_t> macKey,
        std::span<const uint8_t> cipherKey,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> header);

    ~SealDecryptorImpl() override;

    void start(const SegmentSink& sink) override;

    void transform(std::span<const uint8_t> chunk, const SegmentSink& sink) override;

    void flush(const SegmentSink& sink) override;

    void cancel() override;

    [[nodiscard]] TransformState getState() const override;

    [[nodiscard]] bool isVerified() const override { return verified_; }

    [[nodiscard]] bool isTagSplit() const override { return tagSplit_; }

    [[nodiscard]] CounterIv getCurrentIv() const override;

protected:
    void releaseResources() override;

private:
    // Bytes not yet known to be free of tag bytes, with the IV they start under. The IV is
    // empty once earlier chunks have used up the counter; such a chunk may only hold tag bytes.
    struct PendingChunk {
        std::vector<uint8_t> ciphertext;
        std::optional<CounterIv> iv;
    };

    // Moves the trailing TAG_SIZE pending bytes into the returned tag.
    [[nodiscard]] std::vector<uint8_t> extractTag();

    // Authenticates then decrypts one chunk that holds no tag bytes.
    void release(const PendingChunk& chunk, const SegmentSink& sink);

    std::deque<PendingChunk> pending_;
    size_t pendingBytes_;
    std::vector<std::vector<uint8_t>> withheld_;
    bool counterOverrun_;
    bool tagSplit_;
    bool verified_;
};

}
