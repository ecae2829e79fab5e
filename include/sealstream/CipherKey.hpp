#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sealstream {

class CipherKey {
public:
    CipherKey(const std::vector<uint8_t>& keyData, std::string algorithm);
    ~CipherKey();

    CipherKey(const CipherKey&) = delete;
    CipherKey& operator=(const CipherKey&) = delete;
    CipherKey(CipherKey&&) = default;
    CipherKey& operator=(CipherKey&&) = default;

    [[nodiscard]] const std::vector<uint8_t>& getKeyData() const;
    [[nodiscard]] const std::string& getAlgorithm() const;

private:
    std::vector<uint8_t> keyData_;
    std::string algorithm_;
};

}
