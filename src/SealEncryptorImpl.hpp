#pragma once

#include "sealstream/SealEncryptor.hpp"
#include "BaseSealProcessor.hpp"
#include <cstdint>
#include <memory>

namespace sealstream {

class SealEncryptorImpl : public SealEncryptor, public BaseSealProcessor {
public:
    SealEncryptorImpl(
        const SealParameterSpec& parameterSpec,
        std::shared_ptr<CipherProvider> cipherProvider,
        std::shared_ptr<DigestProvider> digestProvider,
        std::span<const uint8_t> macKey,
        std::span<const uint8_t> cipherKey,
        std::span<const uint8_t> iv,
        std::span<const uint8_t> header);

    ~SealEncryptorImpl() override;

    void start(const SegmentSink& sink) override;

    void transform(std::span<const uint8_t> chunk, const SegmentSink& sink) override;

    void flush(const SegmentSink& sink) override;

    void cancel() override;

    [[nodiscard]] TransformState getState() const override;

    [[nodiscard]] std::vector<uint8_t> getHeader() const override;

    [[nodiscard]] CounterIv getCurrentIv() const override;
};

}
