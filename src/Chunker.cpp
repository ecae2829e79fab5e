#include "sealstream/Chunker.hpp"
#include "sealstream/SealException.hpp"
#include "ProcessingGuard.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace sealstream {

Chunker::Chunker(const size_t chunkSize, const size_t offset)
    : chunkSize_(chunkSize),
      bytesToSkip_(offset),
      fillOffset_(0),
      state_(TransformState::Init),
      busy_(false) {

    if (chunkSize == 0) {
        throw InvalidParametersException("chunkSize must be > 0");
    }
}

void Chunker::start(const SegmentSink&) {
    if (state_ != TransformState::Init) {
        throw SealException(std::string("chunker cannot start in state ") + toString(state_));
    }
    buffer_.resize(chunkSize_);
    state_ = TransformState::Processing;
}

void Chunker::transform(const std::span<const uint8_t> fragment, const SegmentSink& sink) {
    assertProcessing();
    ProcessingGuard guard(busy_);

    size_t fragmentOffset = std::min(bytesToSkip_, fragment.size());
    bytesToSkip_ -= fragmentOffset;

    try {
        while (fragmentOffset != fragment.size()) {
            const size_t remainingFragment = fragment.size() - fragmentOffset;
            const size_t remainingBuffer = chunkSize_ - fillOffset_;
            const size_t toCopy = std::min(remainingFragment, remainingBuffer);

            std::copy_n(fragment.begin() + static_cast<std::ptrdiff_t>(fragmentOffset), toCopy,
                        buffer_.begin() + static_cast<std::ptrdiff_t>(fillOffset_));
            fragmentOffset += toCopy;
            fillOffset_ += toCopy;

            if (fillOffset_ == chunkSize_) {
                fillOffset_ = 0;
                sink(buffer_);
                if (state_ == TransformState::Cancelled) {
                    buffer_.clear();
                    buffer_.shrink_to_fit();
                    return;
                }
            }
        }
    } catch (const std::exception&) {
        state_ = TransformState::Failed;
        throw;
    }
}

void Chunker::flush(const SegmentSink& sink) {
    assertProcessing();
    ProcessingGuard guard(busy_);

    std::vector<uint8_t> remainder(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(fillOffset_));
    buffer_.clear();
    buffer_.shrink_to_fit();
    fillOffset_ = 0;
    state_ = TransformState::Finalized;
    try {
        sink(std::move(remainder));
    } catch (const std::exception&) {
        state_ = TransformState::Failed;
        throw;
    }
}

void Chunker::cancel() {
    if (state_ == TransformState::Finalized || state_ == TransformState::Failed) {
        return;
    }
    state_ = TransformState::Cancelled;
    if (!busy_) {
        buffer_.clear();
        buffer_.shrink_to_fit();
    }
}

void Chunker::assertProcessing() const {
    if (state_ != TransformState::Processing) {
        throw SealException(std::string("chunker cannot accept data in state ") + toString(state_));
    }
}

}
