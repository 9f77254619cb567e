#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>

#include <coffer/common/config.hpp>
#include <coffer/ledger/types.hpp>

namespace coffer::api {

    // ===========================================
    // Raw caller input
    // ===========================================

    /// TOPUP, BONUS and SPEND share one request shape
    struct TransferRequest {
        std::string user_id;
        std::string asset_type_id;
        std::string amount; // decimal text, e.g. "12.5"
        std::string idempotency_key;
        std::optional<std::string> description;
        std::optional<std::string> metadata;
    };

    struct BalanceRequest {
        std::string user_id;
        std::string asset_type_id;
    };

    struct HistoryRequest {
        std::string user_id;
        std::optional<std::string> asset_type_id;
    };

    // ===========================================
    // Validation
    // ===========================================

    /// UUID ids, a positive amount of at most 4 decimals after rounding,
    /// and an idempotency key of 1 to config.max_idempotency_key_length characters.
    dp::Result<ledger::TransferCommand, dp::Error> validateTransfer(const TransferRequest &request,
                                                                   const LedgerConfig &config = LedgerConfig{});

    dp::Result<BalanceRequest, dp::Error> validateBalance(const BalanceRequest &request);

    /// The asset filter, when given, must be a UUID; it need not name an existing asset
    dp::Result<HistoryRequest, dp::Error> validateHistory(const HistoryRequest &request);

} // namespace coffer::api
