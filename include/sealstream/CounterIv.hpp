#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sealstream {

// 16-byte counter-mode IV: an 8-byte nonce followed by an 8-byte big-endian block counter.
// The counter moves in whole 16-byte blocks; the nonce never changes.
class CounterIv {
public:
    static constexpr size_t LENGTH = 16;
    static constexpr size_t NONCE_LENGTH = 8;
    static constexpr size_t COUNTER_LENGTH = 8;
    static constexpr size_t BLOCK_LENGTH = 16;

    explicit CounterIv(const std::vector<uint8_t>& bytes);

    static CounterIv from(const std::vector<uint8_t>& nonce, uint64_t counter);

    // Number of cipher blocks a chunk of `length` bytes consumes.
    [[nodiscard]] static uint64_t blocksFor(size_t length);

    [[nodiscard]] const std::vector<uint8_t>& getBytes() const;
    [[nodiscard]] std::vector<uint8_t> getNonce() const;
    [[nodiscard]] uint64_t getCounter() const;

    // True once the last block of the 2^64 block space has been used. An exhausted IV
    // only accepts empty chunks; its counter field reads 0.
    [[nodiscard]] bool isExhausted() const { return exhausted_; }

    // True if a chunk of `length` bytes still has keystream blocks left under this nonce.
    [[nodiscard]] bool fits(size_t length) const;

    // Returns the IV following a chunk of `length` bytes.
    // Throws StreamTooLargeException instead of wrapping the counter.
    [[nodiscard]] CounterIv advanced(size_t length) const;

    bool operator==(const CounterIv& other) const = default;

private:
    void setCounter(uint64_t counter);

    std::vector<uint8_t> bytes_;
    bool exhausted_ = false;
};

}
