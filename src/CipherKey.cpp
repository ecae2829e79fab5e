#include "sealstream/CipherKey.hpp"
#include <openssl/crypto.h>
#include <utility>

namespace sealstream {

CipherKey::CipherKey(const std::vector<uint8_t>& keyData, std::string algorithm)
    : keyData_(keyData), algorithm_(std::move(algorithm)) {
}

CipherKey::~CipherKey() {
    if (!keyData_.empty()) {
        OPENSSL_cleanse(keyData_.data(), keyData_.size());
    }
}

const std::vector<uint8_t>& CipherKey::getKeyData() const {
    return keyData_;
}

const std::string& CipherKey::getAlgorithm() const {
    return algorithm_;
}

}
