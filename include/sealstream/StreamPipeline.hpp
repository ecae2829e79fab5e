#pragma once

#include "sealstream/StreamTransform.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace sealstream {

// Drives a chain of transforms synchronously. Every segment a stage emits is fed to the
// next stage; the last stage emits into the caller's sink. Any failure cancels every stage.
class StreamPipeline {
public:
    StreamPipeline();
    ~StreamPipeline();

    StreamPipeline(const StreamPipeline&) = delete;
    StreamPipeline& operator=(const StreamPipeline&) = delete;
    StreamPipeline(StreamPipeline&&) noexcept;
    StreamPipeline& operator=(StreamPipeline&&) noexcept;

    StreamPipeline& then(std::unique_ptr<StreamTransform> stage);

    void start(const SegmentSink& sink);

    void write(std::span<const uint8_t> fragment, const SegmentSink& sink);

    void close(const SegmentSink& sink);

    void cancel();

    [[nodiscard]] size_t size() const { return stages_.size(); }

    [[nodiscard]] StreamTransform& stage(size_t index) const;

    // Runs start, one write per fragment, and close; returns everything emitted.
    [[nodiscard]] std::vector<uint8_t> run(const std::vector<std::vector<uint8_t>>& fragments);

private:
    void emitTo(size_t index, std::vector<uint8_t> segment, const SegmentSink& sink);
    [[nodiscard]] SegmentSink forwarder(size_t index, const SegmentSink& sink);

    std::vector<std::unique_ptr<StreamTransform>> stages_;
    bool started_;
};

}
