#pragma once

#include "sealstream/CipherProvider.hpp"
#include <string>

namespace sealstream {

// OpenSSL counter-mode cipher. OpenSSL increments all 128 bits of the IV, which matches a
// 64-bit counter as long as the counter does not wrap; CounterIv::advanced rejects that case.
class CtrCipher : public CipherProvider {
public:
    explicit CtrCipher(std::string algorithmName);
    ~CtrCipher() override = default;

    std::vector<uint8_t> encrypt(
        const CipherKey& key,
        const CounterIv& iv,
        const uint8_t* plaintext,
        size_t plaintextLength) override;

    std::vector<uint8_t> decrypt(
        const CipherKey& key,
        const CounterIv& iv,
        const uint8_t* ciphertext,
        size_t ciphertextLength) override;

private:
    std::vector<uint8_t> process(
        const CipherKey& key,
        const CounterIv& iv,
        const uint8_t* input,
        size_t inputLength,
        bool encrypting) const;

    std::string algorithmName_;
};

}
