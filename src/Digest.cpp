#include <utility>

#include "sealstream/Digest.hpp"
#include "sealstream/SealException.hpp"
#include "EvpDigest.hpp"

namespace sealstream {

Digest::Digest(const DigestType type, std::string osslDigestName, const size_t length)
    : type_(type),
      osslDigestName_(std::move(osslDigestName)),
      length_(length) { }

const Digest& Digest::fromType(const DigestType type) {
    switch (type) {
        case DigestType::SHA3_256: {
            static const Digest instance(type, "SHA3-256", 32);
            return instance;
        }
        case DigestType::SHA3_512: {
            static const Digest instance(type, "SHA3-512", 64);
            return instance;
        }
        default:
            throw InvalidParametersException("Unknown digest type");
    }
}

std::unique_ptr<DigestProvider> Digest::getDigestProvider() const {
    return std::make_unique<EvpDigest>(osslDigestName_);
}

}
