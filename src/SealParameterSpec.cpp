#include "sealstream/SealParameterSpec.hpp"
#include "sealstream/SealException.hpp"
#include <string>

namespace sealstream {

const SealParameterSpec SealParameterSpec::AES256CTR_SHA3_256_128K = SealParameterSpec(
    Cipher::fromType(CipherType::AES_256_CTR),
    Digest::fromType(DigestType::SHA3_256),
    DEFAULT_CHUNK_SIZE
);

SealParameterSpec::SealParameterSpec(
    const Cipher& cipher,
    const Digest& digest,
    const size_t chunkSize,
    const size_t offset,
    const PlaintextRelease plaintextRelease)
    : cipher_(cipher),
      digest_(digest),
      chunkSize_(chunkSize),
      offset_(offset),
      plaintextRelease_(plaintextRelease) {

    if (chunkSize == 0) {
        throw InvalidParametersException("chunkSize must be > 0");
    }
    if (cipher.getKeyLength() != KEY_SIZE || cipher.getIvLength() != IV_SIZE ||
        cipher.getBlockLength() != BLOCK_SIZE) {
        throw InvalidParametersException("unsupported cipher geometry for " + cipher.getAlgorithmName());
    }
    if (digest.getLength() < TAG_SIZE) {
        throw InvalidParametersException("digest " + digest.getOsslDigestName() +
                                         " is shorter than the tag, expected at least " +
                                         std::to_string(TAG_SIZE) + " bytes");
    }
}

SealParameterSpec SealParameterSpec::withChunkSize(const size_t chunkSize) const {
    return {cipher_, digest_, chunkSize, offset_, plaintextRelease_};
}

SealParameterSpec SealParameterSpec::withOffset(const size_t offset) const {
    return {cipher_, digest_, chunkSize_, offset, plaintextRelease_};
}

SealParameterSpec SealParameterSpec::withPlaintextRelease(const PlaintextRelease plaintextRelease) const {
    return {cipher_, digest_, chunkSize_, offset_, plaintextRelease};
}

}
