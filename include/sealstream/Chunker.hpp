#pragma once

#include "sealstream/SealParameterSpec.hpp"
#include "sealstream/StreamTransform.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sealstream {

// Re-buffers fragments of arbitrary size into chunks of exactly chunkSize bytes.
// The first `offset` bytes of the stream are dropped. flush() emits the remaining
// partial chunk, which may be empty.
class Chunker : public StreamTransform {
public:
    explicit Chunker(size_t chunkSize = SealParameterSpec::DEFAULT_CHUNK_SIZE, size_t offset = 0);

    void start(const SegmentSink& sink) override;

    void transform(std::span<const uint8_t> fragment, const SegmentSink& sink) override;

    void flush(const SegmentSink& sink) override;

    void cancel() override;

    [[nodiscard]] TransformState getState() const override { return state_; }

    [[nodiscard]] size_t getChunkSize() const { return chunkSize_; }

private:
    void assertProcessing() const;

    size_t chunkSize_;
    size_t bytesToSkip_;
    std::vector<uint8_t> buffer_;
    size_t fillOffset_;
    TransformState state_;
    bool busy_;
};

}
