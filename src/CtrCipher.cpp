#include "CtrCipher.hpp"
#include "sealstream/CipherKey.hpp"
#include "sealstream/CounterIv.hpp"
#include "sealstream/SealException.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <algorithm>
#include <memory>
#include <utility>

namespace sealstream {

// EVP_CipherUpdate takes an int length
static constexpr size_t MAX_UPDATE_LENGTH = 1 << 30;

CtrCipher::CtrCipher(std::string algorithmName)
    : algorithmName_(std::move(algorithmName)) {
}

std::vector<uint8_t> CtrCipher::encrypt(
    const CipherKey& key,
    const CounterIv& iv,
    const uint8_t* plaintext,
    const size_t plaintextLength) {
    return process(key, iv, plaintext, plaintextLength, true);
}

std::vector<uint8_t> CtrCipher::decrypt(
    const CipherKey& key,
    const CounterIv& iv,
    const uint8_t* ciphertext,
    const size_t ciphertextLength) {
    return process(key, iv, ciphertext, ciphertextLength, false);
}

std::vector<uint8_t> CtrCipher::process(
    const CipherKey& key,
    const CounterIv& iv,
    const uint8_t* input,
    const size_t inputLength,
    const bool encrypting) const {

    if (inputLength == 0) {
        return {};
    }
    if (input == nullptr) {
        throw CryptoPrimitiveException("input cannot be null when length > 0");
    }

    EVP_CIPHER* cipher = EVP_CIPHER_fetch(nullptr, algorithmName_.c_str(), nullptr);
    if (!cipher) {
        ERR_clear_error();
        throw CryptoPrimitiveException("Failed to fetch cipher: " + algorithmName_);
    }

    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
        EVP_CIPHER_free(cipher);
        throw CryptoPrimitiveException("Failed to create cipher context");
    }

    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctxGuard(ctx, EVP_CIPHER_CTX_free);
    std::unique_ptr<EVP_CIPHER, decltype(&EVP_CIPHER_free)> cipherGuard(cipher, EVP_CIPHER_free);

    if (key.getKeyData().size() != static_cast<size_t>(EVP_CIPHER_get_key_length(cipher))) {
        throw CryptoPrimitiveException("invalid key length for " + algorithmName_);
    }

    if (EVP_CipherInit_ex(ctx, cipher, nullptr, key.getKeyData().data(), iv.getBytes().data(),
                          encrypting ? 1 : 0) != 1) {
        ERR_clear_error();
        throw CryptoPrimitiveException(encrypting ? "Failed to initialize encryption"
                                                  : "Failed to initialize decryption");
    }

    std::vector<uint8_t> output(inputLength);
    size_t processed = 0;
    while (processed < inputLength) {
        const size_t pieceLength = std::min(inputLength - processed, MAX_UPDATE_LENGTH);
        int len;
        if (EVP_CipherUpdate(ctx, output.data() + processed, &len, input + processed,
                             static_cast<int>(pieceLength)) != 1) {
            ERR_clear_error();
            throw CryptoPrimitiveException(encrypting ? "Failed to encrypt data" : "Failed to decrypt data");
        }
        processed += static_cast<size_t>(len);
    }

    int len;
    if (EVP_CipherFinal_ex(ctx, output.data() + processed, &len) != 1) {
        ERR_clear_error();
        throw CryptoPrimitiveException(encrypting ? "Failed to finalize encryption"
                                                  : "Failed to finalize decryption");
    }
    processed += static_cast<size_t>(len);

    if (processed != inputLength) {
        throw CryptoPrimitiveException("counter mode output length mismatch");
    }

    return output;
}

}
