#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace sealstream {

// Running digest state. Absorption order matters.
class DigestAccumulator {
public:
    virtual ~DigestAccumulator() = default;

    virtual void absorb(const uint8_t* data, size_t length) = 0;

    // May be called once. The accumulator is unusable afterwards.
    [[nodiscard]] virtual std::vector<uint8_t> finalize() = 0;
};

class DigestProvider {
public:
    virtual ~DigestProvider() = default;

    [[nodiscard]] virtual std::unique_ptr<DigestAccumulator> createAccumulator() const = 0;
};

}
