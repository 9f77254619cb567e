#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace coffer {

    // ===========================================
    // Coffer-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_VALIDATION = 100;
    constexpr dp::u32 ERR_CONFLICT = 101;
    constexpr dp::u32 ERR_INSUFFICIENT_FUNDS = 102;
    constexpr dp::u32 ERR_NOT_FOUND = 103;
    constexpr dp::u32 ERR_INTERNAL = 104;
    constexpr dp::u32 ERR_TIMEOUT = 105;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error validation_error(const std::string &msg = "Validation failed") {
        return dp::Error{ERR_VALIDATION, dp::String(msg.c_str())};
    }

    inline dp::Error conflict(const std::string &msg = "Duplicate request detected") {
        return dp::Error{ERR_CONFLICT, dp::String(msg.c_str())};
    }

    inline dp::Error insufficient_funds(const std::string &msg = "Insufficient balance") {
        return dp::Error{ERR_INSUFFICIENT_FUNDS, dp::String(msg.c_str())};
    }

    inline dp::Error not_found(const std::string &msg = "Record not found") {
        return dp::Error{ERR_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error internal_error(const std::string &msg = "Internal error") {
        return dp::Error{ERR_INTERNAL, dp::String(msg.c_str())};
    }

    inline dp::Error timeout(const std::string &msg = "Unit of work timed out") {
        return dp::Error{ERR_TIMEOUT, dp::String(msg.c_str())};
    }

    // ===========================================
    // Classification
    // ===========================================

    /// True when resubmitting the same request (same idempotency key) cannot do harm
    /// and may succeed: Internal, Timeout and Conflict.
    inline bool isRetrySafe(const dp::Error &error) {
        return error.code == ERR_INTERNAL || error.code == ERR_TIMEOUT || error.code == ERR_CONFLICT;
    }

    inline std::string errorKindName(const dp::Error &error) {
        switch (error.code) {
        case ERR_VALIDATION:
            return "ValidationError";
        case ERR_CONFLICT:
            return "ConflictError";
        case ERR_INSUFFICIENT_FUNDS:
            return "InsufficientFundsError";
        case ERR_NOT_FOUND:
            return "NotFoundError";
        case ERR_TIMEOUT:
            return "TimeoutError";
        case ERR_INTERNAL:
            return "InternalError";
        default:
            return "UnknownError";
        }
    }

    inline std::string errorMessage(const dp::Error &error) { return std::string(error.message.c_str()); }

} // namespace coffer
