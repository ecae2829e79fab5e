#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace sealstream {

// Receives every segment a transform emits. Segments are independent copies owned by the sink.
using SegmentSink = std::function<void(std::vector<uint8_t> segment)>;

enum class TransformState : uint8_t {
    Init,
    Processing,
    Finalized,
    Failed,
    Cancelled
};

[[nodiscard]] const char* toString(TransformState state);

// A single-pass, single-use stage of a byte stream.
// start() is called once before any data, transform() once per incoming fragment in order,
// and flush() once at end of input. Instances are not thread-safe and may not be re-entered
// from their own sink; cancel() is the only call allowed while a transform is emitting.
class StreamTransform {
public:
    virtual ~StreamTransform() = default;

    virtual void start(const SegmentSink& sink) = 0;

    virtual void transform(std::span<const uint8_t> fragment, const SegmentSink& sink) = 0;

    virtual void flush(const SegmentSink& sink) = 0;

    // Stops processing at the next primitive call and releases owned buffers.
    // Has no effect on a finalized or failed transform.
    virtual void cancel() = 0;

    [[nodiscard]] virtual TransformState getState() const = 0;

    [[nodiscard]] bool isClosed() const { return getState() == TransformState::Finalized; }
};

}
