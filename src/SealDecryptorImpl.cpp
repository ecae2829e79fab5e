#include "SealDecryptorImpl.hpp"
#include "Hex.hpp"
#include "sealstream/Logger.hpp"
#include "sealstream/SealException.hpp"
#include <openssl/crypto.h>
#include <algorithm>
#include <string>
#include <utility>

namespace sealstream {

static constexpr size_t TAG_SIZE = SealParameterSpec::TAG_SIZE;

SealDecryptorImpl::~SealDecryptorImpl() = default;

SealDecryptorImpl::SealDecryptorImpl(
    const SealParameterSpec& parameterSpec,
    std::shared_ptr<CipherProvider> cipherProvider,
    std::shared_ptr<DigestProvider> digestProvider,
    const std::span<const uint8_t> macKey,
    const std::span<const uint8_t> cipherKey,
    const std::span<const uint8_t> iv,
    const std::span<const uint8_t> header)
    : BaseSealProcessor(parameterSpec, std::move(cipherProvider), std::move(digestProvider),
                        macKey, cipherKey, iv, header),
      pendingBytes_(0),
      counterOverrun_(false),
      tagSplit_(false),
      verified_(false) {
}

void SealDecryptorImpl::start(const SegmentSink&) {
    processInternal(TransformState::Init, [&] {
        primeDigest();
    });
}

void SealDecryptorImpl::transform(const std::span<const uint8_t> chunk, const SegmentSink& sink) {
    processInternal(TransformState::Processing, [&] {
        // Tag bytes consume no counter blocks, so running out of counter is only an error
        // once a chunk turns out to hold ciphertext past the end. See release().
        std::optional<CounterIv> chunkIv;
        if (!counterOverrun_) {
            chunkIv = iv_;
            if (iv_.fits(chunk.size())) {
                iv_ = iv_.advanced(chunk.size());
            } else {
                counterOverrun_ = true;
            }
        }
        pending_.push_back({std::vector<uint8_t>(chunk.begin(), chunk.end()), std::move(chunkIv)});
        pendingBytes_ += chunk.size();

        // A chunk followed by at least TAG_SIZE bytes cannot hold any of the tag. With chunks of
        // at least TAG_SIZE bytes this releases exactly the previous chunk; a shorter chunk keeps
        // the previous one pending because the tag straddles both.
        while (pendingBytes_ - pending_.front().ciphertext.size() >= TAG_SIZE) {
            if (!checkpoint()) {
                return;
            }
            const PendingChunk front = std::move(pending_.front());
            pending_.pop_front();
            pendingBytes_ -= front.ciphertext.size();
            release(front, sink);
        }
    });
}

void SealDecryptorImpl::flush(const SegmentSink& sink) {
    processInternal(TransformState::Processing, [&] {
        if (pendingBytes_ < TAG_SIZE) {
            throw MalformedStreamException("ciphertext stream too short, expected at least " +
                                           std::to_string(TAG_SIZE) + " bytes of tag, got " +
                                           std::to_string(pendingBytes_));
        }

        const std::vector<uint8_t> found = extractTag();
        if (tagSplit_) {
            Logger::getInstance().log(LogLevel::Debug, "tag split across chunk boundary");
        }

        while (!pending_.empty()) {
            if (!checkpoint()) {
                return;
            }
            const PendingChunk front = std::move(pending_.front());
            pending_.pop_front();
            pendingBytes_ -= front.ciphertext.size();
            release(front, sink);
        }

        if (!checkpoint()) {
            return;
        }
        const std::vector<uint8_t> tag = computeTag();

        Logger& logger = Logger::getInstance();
        if (logger.isEnabled(LogLevel::Debug)) {
            logger.log(LogLevel::Debug, "tag found in stream: " + toHex(found));
            logger.log(LogLevel::Debug, "produced tag: " + toHex(tag));
        }

        if (CRYPTO_memcmp(tag.data(), found.data(), TAG_SIZE) != 0) {
            logger.log(LogLevel::Warn, "tags do not match, stream failed authentication");
            throw AuthenticationException("tags do not match");
        }

        verified_ = true;
        std::vector<std::vector<uint8_t>> withheld = std::move(withheld_);
        withheld_.clear();
        finalizeInternal();
        for (auto& segment : withheld) {
            sink(std::move(segment));
        }
    });
}

void SealDecryptorImpl::cancel() {
    cancelInternal();
}

TransformState SealDecryptorImpl::getState() const {
    return getStateInternal();
}

CounterIv SealDecryptorImpl::getCurrentIv() const {
    return iv_;
}

void SealDecryptorImpl::releaseResources() {
    BaseSealProcessor::releaseResources();
    pending_.clear();
    pendingBytes_ = 0;
    withheld_.clear();
}

std::vector<uint8_t> SealDecryptorImpl::extractTag() {
    std::vector<uint8_t> tag(TAG_SIZE);
    size_t remaining = TAG_SIZE;
    int pieces = 0;
    for (auto it = pending_.rbegin(); it != pending_.rend() && remaining > 0; ++it) {
        std::vector<uint8_t>& ciphertext = it->ciphertext;
        const size_t take = std::min(remaining, ciphertext.size());
        if (take == 0) {
            continue;
        }
        std::copy(ciphertext.end() - static_cast<std::ptrdiff_t>(take), ciphertext.end(),
                  tag.begin() + static_cast<std::ptrdiff_t>(remaining - take));
        ciphertext.resize(ciphertext.size() - take);
        pendingBytes_ -= take;
        remaining -= take;
        ++pieces;
    }
    tagSplit_ = pieces > 1;
    return tag;
}

void SealDecryptorImpl::release(const PendingChunk& chunk, const SegmentSink& sink) {
    if (chunk.ciphertext.empty()) {
        return;
    }

    if (!chunk.iv || !chunk.iv->fits(chunk.ciphertext.size())) {
        throw StreamTooLargeException("ciphertext runs past the last block of the counter");
    }

    // Authenticate first, then decrypt.
    absorb(chunk.ciphertext);
    if (!checkpoint()) {
        return;
    }
    std::vector<uint8_t> plaintext = decryptChunk(*chunk.iv, chunk.ciphertext);

    if (parameterSpec_.getPlaintextRelease() == PlaintextRelease::AfterVerification) {
        withheld_.push_back(std::move(plaintext));
    } else {
        sink(std::move(plaintext));
    }
}

}
