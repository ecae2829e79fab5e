#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sealstream {

class CipherKey;
class CounterIv;

// Counter-mode cipher. Both directions are length preserving and depend only on
// the key, the keystream position given by the IV, and the data.
class CipherProvider {
public:
    virtual ~CipherProvider() = default;

    virtual std::vector<uint8_t> encrypt(
        const CipherKey& key,
        const CounterIv& iv,
        const uint8_t* plaintext,
        size_t plaintextLength) = 0;

    virtual std::vector<uint8_t> decrypt(
        const CipherKey& key,
        const CounterIv& iv,
        const uint8_t* ciphertext,
        size_t ciphertextLength) = 0;
};

}
