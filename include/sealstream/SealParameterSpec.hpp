#pragma once

#include "sealstream/Cipher.hpp"
#include "sealstream/Digest.hpp"
#include <cstddef>
#include <cstdint>

namespace sealstream {

// What the decryptor does with plaintext before the tag has been checked.
enum class PlaintextRelease : uint8_t {
    // Emit plaintext as soon as its ciphertext is known not to overlap the tag.
    // Output is provisional: consumers must discard it if the stream later fails authentication.
    Streaming = 0,
    // Hold every plaintext segment until the tag verifies. Buffers the whole payload.
    AfterVerification = 1
};

class SealParameterSpec {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t IV_SIZE = 16;
    static constexpr size_t NONCE_SIZE = 8;
    static constexpr size_t COUNTER_SIZE = 8;
    static constexpr size_t BLOCK_SIZE = 16;
    static constexpr size_t TAG_SIZE = 32;
    static constexpr size_t DEFAULT_CHUNK_SIZE = 128 * 1024;

    // AES-256-CTR, SHA3-256 tag, 128 KiB chunks
    static const SealParameterSpec AES256CTR_SHA3_256_128K;

    SealParameterSpec(const Cipher& cipher, const Digest& digest,
                      size_t chunkSize = DEFAULT_CHUNK_SIZE,
                      size_t offset = 0,
                      PlaintextRelease plaintextRelease = PlaintextRelease::Streaming);

    [[nodiscard]] const Cipher& getCipher() const { return cipher_; }
    [[nodiscard]] const Digest& getDigest() const { return digest_; }
    [[nodiscard]] size_t getChunkSize() const { return chunkSize_; }
    // Leading bytes the encrypt-side chunker drops from the input stream.
    [[nodiscard]] size_t getOffset() const { return offset_; }
    [[nodiscard]] PlaintextRelease getPlaintextRelease() const { return plaintextRelease_; }

    [[nodiscard]] SealParameterSpec withChunkSize(size_t chunkSize) const;
    [[nodiscard]] SealParameterSpec withOffset(size_t offset) const;
    [[nodiscard]] SealParameterSpec withPlaintextRelease(PlaintextRelease plaintextRelease) const;

private:
    Cipher cipher_;
    Digest digest_;
    size_t chunkSize_;
    size_t offset_;
    PlaintextRelease plaintextRelease_;
};

}
