#include <coffer/common/error.hpp>
#include <coffer/ledger/journal.hpp>
#include <coffer/ledger/transaction_coordinator.hpp>
#include <coffer/storage/unit_of_work.hpp>

namespace coffer::ledger {

    TransactionCoordinator::TransactionCoordinator(storage::Database &db, LedgerConfig config)
        : db_(db), config_(config), log_(config.log_level, "coffer.ledger") {}

    dp::Result<TransferResult, dp::Error> TransactionCoordinator::topUp(const TransferCommand &cmd) {
        return execute(TransferKind::TopUp, cmd);
    }

    dp::Result<TransferResult, dp::Error> TransactionCoordinator::bonus(const TransferCommand &cmd) {
        return execute(TransferKind::Bonus, cmd);
    }

    dp::Result<TransferResult, dp::Error> TransactionCoordinator::spend(const TransferCommand &cmd) {
        return execute(TransferKind::Spend, cmd);
    }

    std::string TransactionCoordinator::defaultEntryDescription(TransferKind kind) {
        switch (kind) {
        case TransferKind::TopUp:
            return "Top-up purchase";
        case TransferKind::Bonus:
            return "Bonus/incentive credit";
        case TransferKind::Spend:
            return "In-app purchase";
        default:
            return "";
        }
    }

    std::string TransactionCoordinator::defaultTransactionDescription(TransferKind kind, const Amount &amount) {
        std::string n = amount.toCompactString();
        switch (kind) {
        case TransferKind::TopUp:
            return "Top-up of " + n + " credits";
        case TransferKind::Bonus:
            return "Bonus of " + n + " credits";
        case TransferKind::Spend:
            return "Spend of " + n + " credits";
        default:
            return "";
        }
    }

    dp::Result<void, dp::Error> TransactionCoordinator::validate(const TransferCommand &cmd) const {
        if (!cmd.amount.isPositive()) {
            return dp::Result<void, dp::Error>::err(validation_error("Amount must be positive"));
        }
        if (cmd.amount.units() > Amount::kMaxUnits) {
            return dp::Result<void, dp::Error>::err(validation_error("Amount exceeds the supported range"));
        }
        if (cmd.user_id.empty() || cmd.asset_type_id.empty()) {
            return dp::Result<void, dp::Error>::err(validation_error("User and asset type are required"));
        }
        if (cmd.idempotency_key.empty() || cmd.idempotency_key.size() > config_.max_idempotency_key_length) {
            return dp::Result<void, dp::Error>::err(validation_error(
                "Idempotency key must be 1-" + std::to_string(config_.max_idempotency_key_length) + " characters"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<TransferResult, dp::Error> TransactionCoordinator::execute(TransferKind kind,
                                                                          const TransferCommand &cmd) {
        auto valid = validate(cmd);
        if (!valid.is_ok()) {
            log_.debug("Rejected " + transferKindToString(kind) + ": " + errorMessage(valid.error()));
            return dp::Result<TransferResult, dp::Error>::err(valid.error());
        }

        auto cached = lookupReplay(cmd.idempotency_key);
        if (!cached.is_ok()) {
            return dp::Result<TransferResult, dp::Error>::err(cached.error());
        }
        if (cached.value().has_value()) {
            log_.debug("Replay for key " + cmd.idempotency_key);
            return dp::Result<TransferResult, dp::Error>::ok(*cached.value());
        }

        auto applied = applyOnce(kind, cmd);
        if (applied.is_ok()) {
            const auto &result = applied.value();
            log_.info(transferKindToString(kind) + " " + result.amount.toString() + " committed as transaction " +
                      result.transaction_id);
            return applied;
        }

        // A concurrent request with the same key may have committed first. Its
        // entry makes this attempt fail on the unique key (or, for SPEND, on the
        // balance it already consumed); either way the caller gets that result.
        const auto &error = applied.error();
        if (error.code == ERR_CONFLICT || error.code == ERR_INSUFFICIENT_FUNDS) {
            auto winner = lookupReplay(cmd.idempotency_key);
            if (winner.is_ok() && winner.value().has_value()) {
                log_.debug("Lost race on key " + cmd.idempotency_key + ", returning committed result");
                return dp::Result<TransferResult, dp::Error>::ok(*winner.value());
            }
            if (!winner.is_ok()) {
                log_.error("Replay lookup failed for key " + cmd.idempotency_key + ": " +
                           errorMessage(winner.error()));
            }
        }

        if (error.code == ERR_INTERNAL || error.code == ERR_TIMEOUT) {
            log_.error(transferKindToString(kind) + " failed: " + errorMessage(error));
        } else {
            log_.info(transferKindToString(kind) + " rejected: " + errorMessage(error));
        }
        return applied;
    }

    dp::Result<std::optional<TransferResult>, dp::Error>
    TransactionCoordinator::lookupReplay(const std::string &key) {
        auto unit = db_.beginUnit(storage::UnitMode::Read, config_.unit_timeout);
        auto begun = unit->begin();
        if (!begun.is_ok()) {
            return dp::Result<std::optional<TransferResult>, dp::Error>::err(begun.error());
        }

        auto found = guard_.checkReplay(unit->connection(), key);
        unit->rollback();
        return found;
    }

    dp::Result<TransferResult, dp::Error> TransactionCoordinator::applyOnce(TransferKind kind,
                                                                            const TransferCommand &cmd) {
        auto unit = db_.beginUnit(storage::UnitMode::Write, config_.unit_timeout);
        auto begun = unit->begin();
        if (!begun.is_ok()) {
            return dp::Result<TransferResult, dp::Error>::err(begun.error());
        }
        auto &conn = unit->connection();

        auto user_wallet = wallets_.resolve(*unit, cmd.user_id, cmd.asset_type_id);
        if (!user_wallet.is_ok()) {
            return dp::Result<TransferResult, dp::Error>::err(user_wallet.error());
        }
        auto treasury_wallet = wallets_.resolveTreasury(*unit, cmd.asset_type_id);
        if (!treasury_wallet.is_ok()) {
            return dp::Result<TransferResult, dp::Error>::err(treasury_wallet.error());
        }

        const std::string user_id = user_wallet.value().id;
        const std::string treasury_id = treasury_wallet.value().id;
        if (user_id == treasury_id) {
            return dp::Result<TransferResult, dp::Error>::err(
                validation_error("The treasury cannot transfer to itself"));
        }

        auto locked = locks_.lockInOrder(*unit, {user_id, treasury_id});
        if (!locked.is_ok()) {
            return dp::Result<TransferResult, dp::Error>::err(locked.error());
        }

        LedgerEntry draft;
        draft.asset_type_id = cmd.asset_type_id;
        draft.amount = cmd.amount;
        draft.kind = kind;
        draft.description = cmd.description ? *cmd.description : defaultEntryDescription(kind);
        draft.idempotency_key = cmd.idempotency_key;
        draft.metadata = cmd.metadata;

        if (kind == TransferKind::Spend) {
            // Under lock: nobody else can move value out of this wallet until commit
            auto balance = balances_.balanceOf(conn, user_id);
            if (!balance.is_ok()) {
                return dp::Result<TransferResult, dp::Error>::err(balance.error());
            }
            if (balance.value() < cmd.amount) {
                return dp::Result<TransferResult, dp::Error>::err(
                    insufficient_funds("Insufficient balance. Available: " + balance.value().toString() +
                                       ", Required: " + cmd.amount.toCompactString()));
            }
            draft.debit_wallet_id = user_id;
            draft.credit_wallet_id = treasury_id;
            draft.resulting_balance = balance.value() - cmd.amount;
        } else {
            draft.debit_wallet_id = treasury_id;
            draft.credit_wallet_id = user_id;
        }

        auto txn = LedgerJournal::openTransaction(
            conn, kind, cmd.description ? *cmd.description : defaultTransactionDescription(kind, cmd.amount));
        if (!txn.is_ok()) {
            return dp::Result<TransferResult, dp::Error>::err(txn.error());
        }
        draft.transaction_id = txn.value().id;

        auto entry = LedgerJournal::appendEntry(conn, draft);
        if (!entry.is_ok()) {
            return dp::Result<TransferResult, dp::Error>::err(entry.error());
        }

        auto completed = LedgerJournal::completeTransaction(conn, txn.value().id);
        if (!completed.is_ok()) {
            return dp::Result<TransferResult, dp::Error>::err(completed.error());
        }

        auto committed = unit->commit();
        if (!committed.is_ok()) {
            return dp::Result<TransferResult, dp::Error>::err(committed.error());
        }

        TransferResult result;
        result.transaction_id = txn.value().id;
        result.entry_id = entry.value().id;
        result.kind = kind;
        result.amount = cmd.amount;
        result.remaining_balance = entry.value().resulting_balance;
        result.replay = false;
        return dp::Result<TransferResult, dp::Error>::ok(result);
    }

} // namespace coffer::ledger
