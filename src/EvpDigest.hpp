#pragma once

#include "sealstream/DigestProvider.hpp"
#include <openssl/evp.h>
#include <memory>
#include <string>

namespace sealstream {

class EvpDigestAccumulator : public DigestAccumulator {
public:
    explicit EvpDigestAccumulator(const std::string& digestName);
    ~EvpDigestAccumulator() override = default;

    void absorb(const uint8_t* data, size_t length) override;

    [[nodiscard]] std::vector<uint8_t> finalize() override;

private:
    void assertNotFinalized() const;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
    bool finalized_;
};

class EvpDigest : public DigestProvider {
public:
    explicit EvpDigest(std::string digestName);
    ~EvpDigest() override = default;

    [[nodiscard]] std::unique_ptr<DigestAccumulator> createAccumulator() const override;

private:
    std::string digestName_;
};

}
