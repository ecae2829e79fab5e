#pragma once

#include "sealstream/StreamTransform.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace sealstream {

// First stage of a decrypt pipeline. Consumes the header at the start of the stream,
// compares it with the expected header and forwards everything after it unchanged.
// A different header raises AuthenticationException; a stream that ends inside the
// header raises MalformedStreamException.
class HeaderVerifier : public StreamTransform {
public:
    explicit HeaderVerifier(std::span<const uint8_t> expectedHeader);

    void start(const SegmentSink& sink) override;

    void transform(std::span<const uint8_t> fragment, const SegmentSink& sink) override;

    void flush(const SegmentSink& sink) override;

    void cancel() override;

    [[nodiscard]] TransformState getState() const override { return state_; }

private:
    void assertProcessing() const;
    void verify();

    std::vector<uint8_t> expected_;
    std::vector<uint8_t> received_;
    TransformState state_;
    bool busy_;
};

}
