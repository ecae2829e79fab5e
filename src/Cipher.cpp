#include <utility>

#include "sealstream/Cipher.hpp"
#include "sealstream/SealException.hpp"
#include "CtrCipher.hpp"

namespace sealstream {

Cipher::Cipher(const CipherType type,
               std::string algorithmName,
               const size_t keyLength,
               const size_t ivLength,
               const size_t blockLength)
    : type_(type),
      algorithmName_(std::move(algorithmName)),
      keyLength_(keyLength),
      ivLength_(ivLength),
      blockLength_(blockLength) { }

const Cipher& Cipher::fromType(const CipherType type) {
    switch (type) {
        case CipherType::AES_256_CTR: {
            static const Cipher instance(type, "AES-256-CTR", 32, 16, 16);
            return instance;
        }
        default:
            throw InvalidParametersException("Unknown cipher type");
    }
}

std::unique_ptr<CipherProvider> Cipher::getCipherProvider() const {
    return std::make_unique<CtrCipher>(algorithmName_);
}

}
