#pragma once

#include "sealstream/CounterIv.hpp"
#include "sealstream/StreamTransform.hpp"

namespace sealstream {

// Authenticating decrypt transform over ciphertext followed by its tag (no header).
// Chunks must be cut at the same boundaries the encryptor used.
// flush() throws AuthenticationException when the tag does not match; with
// PlaintextRelease::Streaming everything emitted before that must be discarded.
class SealDecryptor : public StreamTransform {
public:
    ~SealDecryptor() override = default;

    // True once flush() has matched the tag.
    [[nodiscard]] virtual bool isVerified() const = 0;

    // True if the tag was spread across more than one chunk.
    [[nodiscard]] virtual bool isTagSplit() const = 0;

    [[nodiscard]] virtual CounterIv getCurrentIv() const = 0;
};

}
