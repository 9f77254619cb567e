#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>

#include <coffer/common/amount.hpp>

namespace coffer::ledger {

    /// Transfer kinds. TOPUP and BONUS issue value from the treasury, SPEND returns it.
    enum class TransferKind : dp::u8 {
        TopUp = 0,
        Bonus = 1,
        Spend = 2,
    };

    inline std::string transferKindToString(TransferKind kind) {
        switch (kind) {
        case TransferKind::TopUp:
            return "TOPUP";
        case TransferKind::Bonus:
            return "BONUS";
        case TransferKind::Spend:
            return "SPEND";
        default:
            return "UNKNOWN";
        }
    }

    inline std::optional<TransferKind> transferKindFromString(const std::string &value) {
        if (value == "TOPUP")
            return TransferKind::TopUp;
        if (value == "BONUS")
            return TransferKind::Bonus;
        if (value == "SPEND")
            return TransferKind::Spend;
        return std::nullopt;
    }

    /// Transaction status. Failed exists for schema compatibility only: a failed
    /// unit rolls back, so no FAILED row is ever committed.
    enum class TxStatus : dp::u8 {
        Pending = 0,
        Completed = 1,
        Failed = 2,
    };

    inline std::string txStatusToString(TxStatus status) {
        switch (status) {
        case TxStatus::Pending:
            return "PENDING";
        case TxStatus::Completed:
            return "COMPLETED";
        case TxStatus::Failed:
            return "FAILED";
        default:
            return "UNKNOWN";
        }
    }

    inline std::optional<TxStatus> txStatusFromString(const std::string &value) {
        if (value == "PENDING")
            return TxStatus::Pending;
        if (value == "COMPLETED")
            return TxStatus::Completed;
        if (value == "FAILED")
            return TxStatus::Failed;
        return std::nullopt;
    }

    // ===========================================
    // Stored records
    // ===========================================

    struct AssetType {
        std::string id;
        std::string name;
        std::string symbol;
        std::optional<std::string> description;
        int64_t created_at = 0;
    };

    struct User {
        std::string id;
        std::string username;
        std::string email;
        bool is_system = false;
        int64_t created_at = 0;
    };

    /// One account per (user, asset). Holds no balance; see BalanceCalculator.
    struct Wallet {
        std::string id;
        std::string user_id;
        std::string asset_type_id;
        int64_t created_at = 0;
    };

    struct TransactionRecord {
        std::string id;
        TransferKind kind = TransferKind::TopUp;
        TxStatus status = TxStatus::Pending;
        std::optional<std::string> description;
        int64_t created_at = 0;
        int64_t updated_at = 0;
    };

    /// Immutable record of one value movement from debit wallet to credit wallet
    struct LedgerEntry {
        int64_t sequence = 0;
        std::string id;
        std::string transaction_id;
        std::string asset_type_id;
        std::string debit_wallet_id;
        std::string credit_wallet_id;
        Amount amount;
        TransferKind kind = TransferKind::TopUp;
        std::optional<std::string> description;
        std::optional<std::string> idempotency_key;
        std::optional<std::string> metadata; // free-form JSON text
        std::optional<Amount> resulting_balance; // SPEND only: user balance right after the entry
        std::string prev_hash;
        std::string entry_hash;
        int64_t created_at = 0;
    };

    // ===========================================
    // Engine inputs and outputs
    // ===========================================

    /// Already-validated transfer input for the TransactionCoordinator
    struct TransferCommand {
        std::string user_id;
        std::string asset_type_id;
        Amount amount;
        std::string idempotency_key;
        std::optional<std::string> description;
        std::optional<std::string> metadata;
    };

    struct TransferResult {
        std::string transaction_id;
        std::string entry_id;
        TransferKind kind = TransferKind::TopUp;
        Amount amount;
        std::optional<Amount> remaining_balance; // SPEND only
        bool replay = false;
    };

    struct BalanceView {
        std::string user_id;
        std::string asset_type_id;
        std::string asset_name;
        std::string asset_symbol;
        Amount balance;

        std::string balanceString() const { return balance.toString(); }
    };

    struct HistoryItem {
        std::string id;
        TransferKind kind = TransferKind::TopUp;
        TxStatus status = TxStatus::Pending;
        Amount amount;
        std::optional<std::string> description;
        int64_t created_at = 0;
        std::string debit_wallet_id;
        std::string credit_wallet_id;
    };

} // namespace coffer::ledger
