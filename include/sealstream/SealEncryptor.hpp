#pragma once

#include "sealstream/CounterIv.hpp"
#include "sealstream/StreamTransform.hpp"
#include <cstdint>
#include <vector>

namespace sealstream {

// Encrypt-then-MAC transform.
// start() emits the header, transform() emits one ciphertext segment per chunk,
// flush() emits the TAG_SIZE byte tag.
class SealEncryptor : public StreamTransform {
public:
    ~SealEncryptor() override = default;

    [[nodiscard]] virtual std::vector<uint8_t> getHeader() const = 0;

    // IV the next chunk will be encrypted under.
    [[nodiscard]] virtual CounterIv getCurrentIv() const = 0;
};

}
