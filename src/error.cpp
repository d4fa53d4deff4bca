#include "digitloom/error.hpp"

namespace digitloom {

namespace {

std::string format_message(ErrorCode code, const std::string& message, const std::string& context) {
    std::string result = std::string(error_code_name(code)) + ": " + message;
    if (!context.empty()) {
        result += " [" + context + "]";
    }
    return result;
}

} // namespace

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::PrecisionExhausted:    return "PrecisionExhausted";
        case ErrorCode::InvalidExpression:     return "InvalidExpression";
        case ErrorCode::UnsupportedBase:       return "UnsupportedBase";
        case ErrorCode::UnsupportedConstant:   return "UnsupportedConstant";
        case ErrorCode::InvalidRequest:        return "InvalidRequest";
        case ErrorCode::ChunkIntegrityFailure: return "ChunkIntegrityFailure";
        case ErrorCode::AuthenticationFailure: return "AuthenticationFailure";
        case ErrorCode::ContainerFormat:       return "ContainerFormatError";
        case ErrorCode::CancellationRequested: return "CancellationRequested";
        case ErrorCode::Io:                    return "IoError";
        case ErrorCode::Config:                return "ConfigError";
        case ErrorCode::Crypto:                return "CryptoError";
    }
    return "Error";
}

Error::Error(ErrorCode code, const std::string& message, const std::string& context)
    : std::runtime_error(format_message(code, message, context))
    , code_(code)
    , context_(context) {}

InvalidExpression::InvalidExpression(const std::string& message, size_t offset)
    : Error(ErrorCode::InvalidExpression, message, "offset " + std::to_string(offset))
    , offset_(offset) {}

UnsupportedBase::UnsupportedBase(int base)
    : Error(ErrorCode::UnsupportedBase,
            "base " + std::to_string(base) + " is not supported (expected 10 or 16)")
    , base_(base) {}

ChunkIntegrityFailure::ChunkIntegrityFailure(uint64_t chunk_index, const std::string& reason,
                                             const std::string& expected_digest,
                                             const std::string& actual_digest)
    : Error(ErrorCode::ChunkIntegrityFailure,
            "chunk " + std::to_string(chunk_index) + ": " + reason,
            expected_digest.empty() ? std::string()
                                    : "expected " + expected_digest + ", actual " + actual_digest)
    , chunk_index_(chunk_index)
    , reason_(reason)
    , expected_(expected_digest)
    , actual_(actual_digest) {}

CancellationRequested::CancellationRequested(uint64_t digits_completed)
    : Error(ErrorCode::CancellationRequested,
            "generation cancelled after " + std::to_string(digits_completed) + " digits")
    , digits_completed_(digits_completed) {}

} // namespace digitloom
