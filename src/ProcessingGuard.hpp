#pragma once

#include "sealstream/SealException.hpp"

namespace sealstream {

// Marks a transform as busy for the duration of one call and rejects re-entry.
class ProcessingGuard {
public:
    explicit ProcessingGuard(bool& busy) : busy_(busy) {
        if (busy_) {
            throw SealException("stream transform re-entered while processing");
        }
        busy_ = true;
    }

    ~ProcessingGuard() {
        busy_ = false;
    }

    ProcessingGuard(const ProcessingGuard&) = delete;
    ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
    bool& busy_;
};

}
