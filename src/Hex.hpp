#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace sealstream {

[[nodiscard]] std::string toHex(std::span<const uint8_t> bytes);

}
