#include "HeaderVerifier.hpp"
#include "ProcessingGuard.hpp"
#include "sealstream/Logger.hpp"
#include "sealstream/SealException.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <string>

namespace sealstream {

HeaderVerifier::HeaderVerifier(const std::span<const uint8_t> expectedHeader)
    : expected_(expectedHeader.begin(), expectedHeader.end()),
      state_(TransformState::Init),
      busy_(false) {
}

void HeaderVerifier::start(const SegmentSink&) {
    if (state_ != TransformState::Init) {
        throw SealException(std::string("header verifier cannot start in state ") + toString(state_));
    }
    received_.reserve(expected_.size());
    state_ = TransformState::Processing;
    if (expected_.empty()) {
        verify();
    }
}

void HeaderVerifier::transform(const std::span<const uint8_t> fragment, const SegmentSink& sink) {
    assertProcessing();
    ProcessingGuard guard(busy_);

    size_t consumed = 0;
    if (received_.size() < expected_.size()) {
        consumed = std::min(expected_.size() - received_.size(), fragment.size());
        received_.insert(received_.end(), fragment.begin(), fragment.begin() + static_cast<std::ptrdiff_t>(consumed));
        if (received_.size() == expected_.size()) {
            verify();
        }
    }
    if (consumed == fragment.size()) {
        return;
    }

    try {
        sink(std::vector<uint8_t>(fragment.begin() + static_cast<std::ptrdiff_t>(consumed), fragment.end()));
    } catch (const std::exception&) {
        state_ = TransformState::Failed;
        throw;
    }
}

void HeaderVerifier::flush(const SegmentSink&) {
    assertProcessing();
    if (received_.size() < expected_.size()) {
        state_ = TransformState::Failed;
        throw MalformedStreamException("stream ended inside the header, expected " +
                                       std::to_string(expected_.size()) + " bytes, got " +
                                       std::to_string(received_.size()));
    }
    state_ = TransformState::Finalized;
}

void HeaderVerifier::cancel() {
    if (state_ == TransformState::Finalized || state_ == TransformState::Failed) {
        return;
    }
    state_ = TransformState::Cancelled;
}

void HeaderVerifier::assertProcessing() const {
    if (state_ != TransformState::Processing) {
        throw SealException(std::string("header verifier cannot accept data in state ") + toString(state_));
    }
}

void HeaderVerifier::verify() {
    if (CRYPTO_memcmp(received_.data(), expected_.data(), expected_.size()) != 0) {
        state_ = TransformState::Failed;
        Logger::getInstance().log(LogLevel::Warn, "stream header does not match, stream failed authentication");
        throw AuthenticationException("invalid stream header");
    }
}

}
