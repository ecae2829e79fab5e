#include "Hex.hpp"
#include <iomanip>
#include <sstream>

namespace sealstream {

std::string toHex(const std::span<const uint8_t> bytes) {
    std::stringstream ss;
    for (const uint8_t byte : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return ss.str();
}

}
