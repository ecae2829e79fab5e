#include "SealEncryptorImpl.hpp"
#include "Hex.hpp"
#include "sealstream/Logger.hpp"
#include <utility>

namespace sealstream {

SealEncryptorImpl::~SealEncryptorImpl() = default;

SealEncryptorImpl::SealEncryptorImpl(
    const SealParameterSpec& parameterSpec,
    std::shared_ptr<CipherProvider> cipherProvider,
    std::shared_ptr<DigestProvider> digestProvider,
    const std::span<const uint8_t> macKey,
    const std::span<const uint8_t> cipherKey,
    const std::span<const uint8_t> iv,
    const std::span<const uint8_t> header)
    : BaseSealProcessor(parameterSpec, std::move(cipherProvider), std::move(digestProvider),
                        macKey, cipherKey, iv, header) {
}

void SealEncryptorImpl::start(const SegmentSink& sink) {
    processInternal(TransformState::Init, [&] {
        primeDigest();
        if (getStateInternal() == TransformState::Processing) {
            sink(header_);
        }
    });
}

void SealEncryptorImpl::transform(const std::span<const uint8_t> chunk, const SegmentSink& sink) {
    processInternal(TransformState::Processing, [&] {
        const CounterIv next = iv_.advanced(chunk.size());

        if (!checkpoint()) {
            return;
        }
        std::vector<uint8_t> ciphertext = encryptChunk(iv_, chunk);

        if (!checkpoint()) {
            return;
        }
        absorb(ciphertext);

        iv_ = next;
        sink(std::move(ciphertext));
    });
}

void SealEncryptorImpl::flush(const SegmentSink& sink) {
    processInternal(TransformState::Processing, [&] {
        if (!checkpoint()) {
            return;
        }
        std::vector<uint8_t> tag = computeTag();
        Logger::getInstance().log(LogLevel::Debug, "produced tag: " + toHex(tag));

        finalizeInternal();
        sink(std::move(tag));
    });
}

void SealEncryptorImpl::cancel() {
    cancelInternal();
}

TransformState SealEncryptorImpl::getState() const {
    return getStateInternal();
}

std::vector<uint8_t> SealEncryptorImpl::getHeader() const {
    return header_;
}

CounterIv SealEncryptorImpl::getCurrentIv() const {
    return iv_;
}

}
