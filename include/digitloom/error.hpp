/**
 * Error taxonomy for digit generation and the chunked container.
 *
 * Engine failures (PrecisionExhausted) are retried once by the caller with
 * a wider guard before surfacing. Container failures are never retried.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace digitloom {

enum class ErrorCode {
    PrecisionExhausted = 1,
    InvalidExpression = 2,
    UnsupportedBase = 3,
    UnsupportedConstant = 4,
    InvalidRequest = 5,
    ChunkIntegrityFailure = 10,
    AuthenticationFailure = 11,
    ContainerFormat = 12,
    CancellationRequested = 20,
    Io = 30,
    Config = 31,
    Crypto = 32
};

const char* error_code_name(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message, const std::string& context = "");

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }

private:
    ErrorCode code_;
    std::string context_;
};

class PrecisionExhausted : public Error {
public:
    explicit PrecisionExhausted(const std::string& message, const std::string& context = "")
        : Error(ErrorCode::PrecisionExhausted, message, context) {}
};

class InvalidExpression : public Error {
public:
    InvalidExpression(const std::string& message, size_t offset);

    // Character offset into the expression text where parsing failed.
    size_t offset() const noexcept { return offset_; }

private:
    size_t offset_;
};

class UnsupportedBase : public Error {
public:
    explicit UnsupportedBase(int base);

    int base() const noexcept { return base_; }

private:
    int base_;
};

class UnsupportedConstant : public Error {
public:
    explicit UnsupportedConstant(const std::string& message)
        : Error(ErrorCode::UnsupportedConstant, message) {}
};

class InvalidRequest : public Error {
public:
    explicit InvalidRequest(const std::string& message)
        : Error(ErrorCode::InvalidRequest, message) {}
};

class ChunkIntegrityFailure : public Error {
public:
    ChunkIntegrityFailure(uint64_t chunk_index, const std::string& reason,
                          const std::string& expected_digest = "",
                          const std::string& actual_digest = "");

    uint64_t chunk_index() const noexcept { return chunk_index_; }
    const std::string& reason() const noexcept { return reason_; }
    const std::string& expected_digest() const noexcept { return expected_; }
    const std::string& actual_digest() const noexcept { return actual_; }

private:
    uint64_t chunk_index_;
    std::string reason_;
    std::string expected_;
    std::string actual_;
};

class AuthenticationFailure : public Error {
public:
    explicit AuthenticationFailure(const std::string& message)
        : Error(ErrorCode::AuthenticationFailure, message) {}
};

class ContainerFormatError : public Error {
public:
    explicit ContainerFormatError(const std::string& message, const std::string& context = "")
        : Error(ErrorCode::ContainerFormat, message, context) {}
};

class CancellationRequested : public Error {
public:
    explicit CancellationRequested(uint64_t digits_completed = 0);

    uint64_t digits_completed() const noexcept { return digits_completed_; }

private:
    uint64_t digits_completed_;
};

class IoError : public Error {
public:
    explicit IoError(const std::string& message, const std::string& path = "")
        : Error(ErrorCode::Io, message, path) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message, const std::string& key = "")
        : Error(ErrorCode::Config, message, key) {}
};

class CryptoError : public Error {
public:
    explicit CryptoError(const std::string& message)
        : Error(ErrorCode::Crypto, message) {}
};

} // namespace digitloom
