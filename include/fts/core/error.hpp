#pragma once

#include <string>

namespace fts {

/**
 * @brief Error taxonomy shared by every layer
 *
 * IOFailure and ConstraintViolation are the two store error kinds: they void
 * the attempted transaction and nothing else. TransientSync failures are
 * retried with backoff, PermanentSync failures never are. InvalidOperation
 * is caller misuse rejected before anything is written.
 */
enum class ErrorCode {
    IOFailure,
    ConstraintViolation,
    NotFound,
    InvalidOperation,
    TransientSync,
    PermanentSync,
    InvalidArgument
};

struct Error {
    ErrorCode code = ErrorCode::IOFailure;
    std::string message;

    static Error io_failure(std::string msg) { return {ErrorCode::IOFailure, std::move(msg)}; }
    static Error constraint(std::string msg) { return {ErrorCode::ConstraintViolation, std::move(msg)}; }
    static Error not_found(std::string msg) { return {ErrorCode::NotFound, std::move(msg)}; }
    static Error invalid_operation(std::string msg) { return {ErrorCode::InvalidOperation, std::move(msg)}; }
    static Error transient(std::string msg) { return {ErrorCode::TransientSync, std::move(msg)}; }
    static Error permanent(std::string msg) { return {ErrorCode::PermanentSync, std::move(msg)}; }
    static Error invalid_argument(std::string msg) { return {ErrorCode::InvalidArgument, std::move(msg)}; }

    bool is_store_error() const noexcept {
        return code == ErrorCode::IOFailure || code == ErrorCode::ConstraintViolation;
    }

    bool is_sync_error() const noexcept {
        return code == ErrorCode::TransientSync || code == ErrorCode::PermanentSync;
    }
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::IOFailure: return "IOFailure";
        case ErrorCode::ConstraintViolation: return "ConstraintViolation";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidOperation: return "InvalidOperation";
        case ErrorCode::TransientSync: return "TransientSyncError";
        case ErrorCode::PermanentSync: return "PermanentSyncError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

} // namespace fts
