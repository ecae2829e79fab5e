#pragma once

#include <sealstream/CipherKey.hpp>
#include <sealstream/CipherProvider.hpp>
#include <sealstream/CounterIv.hpp>
#include <sealstream/DigestProvider.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace sealstream::test {

// Deterministic stand-in for a counter-mode cipher: XORs each byte with a value derived from
// the key, nonce, block counter and position in the block. Records every call.
class RecordingCipher : public CipherProvider {
public:
    struct Call {
        bool encrypting;
        CounterIv iv;
        size_t length;
    };

    std::vector<uint8_t> encrypt(const CipherKey& key, const CounterIv& iv,
                                 const uint8_t* plaintext, const size_t plaintextLength) override {
        return process(key, iv, plaintext, plaintextLength, true);
    }

    std::vector<uint8_t> decrypt(const CipherKey& key, const CounterIv& iv,
                                 const uint8_t* ciphertext, const size_t ciphertextLength) override {
        return process(key, iv, ciphertext, ciphertextLength, false);
    }

    [[nodiscard]] size_t countCalls(const bool encrypting) const {
        size_t count = 0;
        for (const auto& call : calls) {
            count += call.encrypting == encrypting ? 1 : 0;
        }
        return count;
    }

    std::vector<Call> calls;
    // When set, the call with this index throws.
    std::optional<size_t> failAtCall;

private:
    std::vector<uint8_t> process(const CipherKey& key, const CounterIv& iv, const uint8_t* input,
                                 const size_t length, const bool encrypting) {
        if (failAtCall && *failAtCall == calls.size()) {
            throw std::runtime_error("injected cipher failure");
        }
        calls.push_back({encrypting, iv, length});

        const auto& keyData = key.getKeyData();
        const auto nonce = iv.getNonce();
        std::vector<uint8_t> output(length);
        for (size_t i = 0; i < length; ++i) {
            const uint64_t block = iv.getCounter() + i / 16;
            const auto stream = static_cast<uint8_t>(keyData[i % keyData.size()] ^ nonce[i % 8] ^
                                                     (block * 131 + i % 16));
            output[i] = input[i] ^ stream;
        }
        return output;
    }
};

// Order-sensitive 32-byte digest built from four FNV-1a lanes.
class FakeDigestAccumulator : public DigestAccumulator {
public:
    void absorb(const uint8_t* data, const size_t length) override {
        for (size_t i = 0; i < length; ++i) {
            for (size_t lane = 0; lane < lanes_.size(); ++lane) {
                lanes_[lane] ^= data[i] + lane;
                lanes_[lane] *= 0x100000001b3ULL;
            }
        }
        absorbed_ += length;
    }

    std::vector<uint8_t> finalize() override {
        std::vector<uint8_t> out;
        for (uint64_t lane : lanes_) {
            lane ^= absorbed_;
            for (int b = 0; b < 8; ++b) {
                out.push_back(static_cast<uint8_t>(lane >> (8 * b)));
            }
        }
        return out;
    }

private:
    std::vector<uint64_t> lanes_ = {0xcbf29ce484222325ULL, 0x84222325cbf29ce4ULL,
                                    0x9ce484222325cbf2ULL, 0x2325cbf29ce48422ULL};
    uint64_t absorbed_ = 0;
};

class FakeDigest : public DigestProvider {
public:
    [[nodiscard]] std::unique_ptr<DigestAccumulator> createAccumulator() const override {
        return std::make_unique<FakeDigestAccumulator>();
    }
};

}
