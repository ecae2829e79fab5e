#include "EvpDigest.hpp"
#include "sealstream/SealException.hpp"
#include <openssl/err.h>
#include <utility>

namespace sealstream {

EvpDigestAccumulator::EvpDigestAccumulator(const std::string& digestName)
    : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free),
      finalized_(false) {

    if (!ctx_) {
        throw CryptoPrimitiveException("Failed to create digest context");
    }

    EVP_MD* md = EVP_MD_fetch(nullptr, digestName.c_str(), nullptr);
    if (!md) {
        ERR_clear_error();
        throw CryptoPrimitiveException("Failed to fetch digest: " + digestName);
    }

    // The context keeps its own reference to the fetched digest.
    const int initResult = EVP_DigestInit_ex(ctx_.get(), md, nullptr);
    EVP_MD_free(md);
    if (initResult != 1) {
        ERR_clear_error();
        throw CryptoPrimitiveException("Failed to initialize digest: " + digestName);
    }
}

void EvpDigestAccumulator::absorb(const uint8_t* data, const size_t length) {
    assertNotFinalized();
    if (length == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
        ERR_clear_error();
        throw CryptoPrimitiveException("Failed to update digest");
    }
}

std::vector<uint8_t> EvpDigestAccumulator::finalize() {
    assertNotFinalized();
    finalized_ = true;

    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), result.data(), &outLen) != 1) {
        ERR_clear_error();
        throw CryptoPrimitiveException("Digest computation failed");
    }
    result.resize(outLen);
    return result;
}

void EvpDigestAccumulator::assertNotFinalized() const {
    if (finalized_) {
        throw CryptoPrimitiveException("digest has already been finalized");
    }
}

EvpDigest::EvpDigest(std::string digestName)
    : digestName_(std::move(digestName)) {
}

std::unique_ptr<DigestAccumulator> EvpDigest::createAccumulator() const {
    return std::make_unique<EvpDigestAccumulator>(digestName_);
}

}
