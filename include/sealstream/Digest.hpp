#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace sealstream {

class DigestProvider;

enum class DigestType : uint8_t {
    SHA3_256 = 0,
    SHA3_512 = 1
};

class Digest {
public:
    [[nodiscard]] static const Digest& fromType(DigestType type);

    [[nodiscard]] DigestType getType() const { return type_; }
    [[nodiscard]] const std::string& getOsslDigestName() const { return osslDigestName_; }
    // Native output length. Tags are always truncated to SealParameterSpec::TAG_SIZE.
    [[nodiscard]] size_t getLength() const { return length_; }

    [[nodiscard]] std::unique_ptr<DigestProvider> getDigestProvider() const;

private:
    Digest(DigestType type, std::string osslDigestName, size_t length);

    DigestType type_;
    std::string osslDigestName_;
    size_t length_;
};

}
