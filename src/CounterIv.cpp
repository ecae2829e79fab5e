#include "sealstream/CounterIv.hpp"
#include "sealstream/SealException.hpp"
#include <algorithm>
#include <limits>
#include <string>

namespace sealstream {

CounterIv::CounterIv(const std::vector<uint8_t>& bytes) : bytes_(bytes) {
    if (bytes_.size() != LENGTH) {
        throw InvalidParametersException("invalid IV length, expected " + std::to_string(LENGTH) +
                                         ", got " + std::to_string(bytes_.size()));
    }
}

CounterIv CounterIv::from(const std::vector<uint8_t>& nonce, const uint64_t counter) {
    if (nonce.size() != NONCE_LENGTH) {
        throw InvalidParametersException("invalid nonce length, expected " + std::to_string(NONCE_LENGTH) +
                                         ", got " + std::to_string(nonce.size()));
    }
    std::vector<uint8_t> bytes(LENGTH, 0);
    std::ranges::copy(nonce, bytes.begin());
    CounterIv iv(bytes);
    iv.setCounter(counter);
    return iv;
}

uint64_t CounterIv::blocksFor(const size_t length) {
    return length / BLOCK_LENGTH + (length % BLOCK_LENGTH != 0 ? 1 : 0);
}

const std::vector<uint8_t>& CounterIv::getBytes() const {
    return bytes_;
}

std::vector<uint8_t> CounterIv::getNonce() const {
    return {bytes_.begin(), bytes_.begin() + NONCE_LENGTH};
}

uint64_t CounterIv::getCounter() const {
    uint64_t counterBE;
    std::copy_n(bytes_.data() + NONCE_LENGTH, COUNTER_LENGTH, reinterpret_cast<uint8_t*>(&counterBE));
    return __builtin_bswap64(counterBE);
}

bool CounterIv::fits(const size_t length) const {
    const uint64_t blocks = blocksFor(length);
    if (blocks == 0) {
        return true;
    }
    // Blocks counter .. counter + blocks - 1 must all exist.
    return !exhausted_ && blocks - 1 <= std::numeric_limits<uint64_t>::max() - getCounter();
}

CounterIv CounterIv::advanced(const size_t length) const {
    const uint64_t blocks = blocksFor(length);
    if (!fits(length)) {
        throw StreamTooLargeException("block counter exhausted, " + std::to_string(blocks) +
                                      " blocks requested at counter " +
                                      (exhausted_ ? std::string("2^64") : std::to_string(getCounter())));
    }
    if (blocks == 0) {
        return *this;
    }
    CounterIv next(bytes_);
    const uint64_t counter = getCounter();
    if (blocks - 1 == std::numeric_limits<uint64_t>::max() - counter) {
        next.setCounter(0);
        next.exhausted_ = true;
    } else {
        next.setCounter(counter + blocks);
    }
    return next;
}

void CounterIv::setCounter(const uint64_t counter) {
    const uint64_t counterBE = __builtin_bswap64(counter);
    const auto* counterBytes = reinterpret_cast<const uint8_t*>(&counterBE);
    std::copy_n(counterBytes, COUNTER_LENGTH, bytes_.data() + NONCE_LENGTH);
}

}
