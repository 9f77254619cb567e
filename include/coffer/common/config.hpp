#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

#include "log.hpp"

namespace coffer {

    /// Engine-level settings. Store settings live in storage::OpenOptions.
    struct LedgerConfig {
        /// Upper bound on one atomic unit of work, lock waits included
        std::chrono::milliseconds unit_timeout{10000};

        /// Maximum entries returned by a history query
        int32_t history_limit = 50;

        size_t max_idempotency_key_length = 255;

        LogLevel log_level = LogLevel::Error;

        LedgerConfig() = default;
    };

} // namespace coffer
