#include "MacKey.hpp"
#include <openssl/crypto.h>

namespace sealstream {

MacKey::MacKey(const std::vector<uint8_t>& keyData) : keyData_(keyData) {
}

MacKey::~MacKey() {
    if (!keyData_.empty()) {
        OPENSSL_cleanse(keyData_.data(), keyData_.size());
    }
}

const std::vector<uint8_t>& MacKey::getKeyData() const {
    return keyData_;
}

}
