#pragma once

#include <exception>
#include <string>
#include <utility>

namespace sealstream {

class SealException : public std::exception {
public:
    explicit SealException(std::string message)
        : message_(std::move(message)) {}

    explicit SealException(const std::string& message, const std::exception& cause)
        : message_(message + ": " + cause.what()) {}

    explicit SealException(const std::exception& cause)
        : message_(cause.what()) {}

    [[nodiscard]] const char* what() const noexcept override {
        return message_.c_str();
    }

private:
    std::string message_;
};

// Wrong key, IV or chunk parameters. Raised before any data is processed.
class InvalidParametersException : public SealException {
public:
    using SealException::SealException;
};

// The cipher or digest primitive failed. Fatal for the stream.
class CryptoPrimitiveException : public SealException {
public:
    using SealException::SealException;
};

// The tag recomputed over header and ciphertext does not match the tag found in the stream.
// Any plaintext emitted before this was raised must be discarded.
class AuthenticationException : public SealException {
public:
    using SealException::SealException;
};

// The ciphertext stream ended before a complete tag was seen.
class MalformedStreamException : public SealException {
public:
    using SealException::SealException;
};

// The 64-bit block counter would wrap around.
class StreamTooLargeException : public SealException {
public:
    using SealException::SealException;
};

}
