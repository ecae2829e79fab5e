#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace sealstream {

class CipherProvider;

enum class CipherType : uint8_t {
    AES_256_CTR = 0
};

class Cipher {
public:
    [[nodiscard]] static const Cipher& fromType(CipherType type);

    [[nodiscard]] CipherType getType() const { return type_; }
    [[nodiscard]] const std::string& getAlgorithmName() const { return algorithmName_; }
    [[nodiscard]] size_t getKeyLength() const { return keyLength_; }
    [[nodiscard]] size_t getIvLength() const { return ivLength_; }
    [[nodiscard]] size_t getBlockLength() const { return blockLength_; }

    [[nodiscard]] std::unique_ptr<CipherProvider> getCipherProvider() const;

private:
    Cipher(CipherType type, std::string algorithmName,
           size_t keyLength, size_t ivLength, size_t blockLength);

    CipherType type_;
    std::string algorithmName_;
    size_t keyLength_;
    size_t ivLength_;
    size_t blockLength_;
};

}
