#pragma once

#include <cstdint>
#include <vector>

namespace sealstream {

class MacKey {
public:
    explicit MacKey(const std::vector<uint8_t>& keyData);
    ~MacKey();

    MacKey(const MacKey&) = delete;
    MacKey& operator=(const MacKey&) = delete;
    MacKey(MacKey&&) noexcept = default;
    MacKey& operator=(MacKey&&) noexcept = default;

    [[nodiscard]] const std::vector<uint8_t>& getKeyData() const;

private:
    std::vector<uint8_t> keyData_;
};

}
