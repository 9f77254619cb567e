#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>

#include <coffer/common/config.hpp>
#include <coffer/common/log.hpp>
#include <coffer/storage/database.hpp>

#include "balance_calculator.hpp"
#include "idempotency_guard.hpp"
#include "lock_coordinator.hpp"
#include "types.hpp"
#include "wallet_registry.hpp"

namespace coffer::ledger {

    // ===========================================
    // TransactionCoordinator - TOPUP / BONUS / SPEND
    // ===========================================

    /// Runs every transfer as one atomic unit: resolve both wallets, lock them
    /// in id order, check funds (SPEND), then write the PENDING transaction,
    /// the ledger entry and the COMPLETED status before a single commit.
    /// Safe to share between threads.
    class TransactionCoordinator {
      public:
        explicit TransactionCoordinator(storage::Database &db, LedgerConfig config = LedgerConfig{});

        /// Treasury -> user, real-money purchase
        dp::Result<TransferResult, dp::Error> topUp(const TransferCommand &cmd);

        /// Treasury -> user, free credits
        dp::Result<TransferResult, dp::Error> bonus(const TransferCommand &cmd);

        /// User -> treasury. Never drives the user's balance below zero.
        dp::Result<TransferResult, dp::Error> spend(const TransferCommand &cmd);

        /// Shared protocol behind the three operations. A key that already
        /// committed yields the original result with replay = true.
        dp::Result<TransferResult, dp::Error> execute(TransferKind kind, const TransferCommand &cmd);

        const LedgerConfig &config() const { return config_; }

        /// "Top-up purchase", "Bonus/incentive credit", "In-app purchase"
        static std::string defaultEntryDescription(TransferKind kind);

        /// e.g. "Spend of 12.5 credits"
        static std::string defaultTransactionDescription(TransferKind kind, const Amount &amount);

      private:
        dp::Result<void, dp::Error> validate(const TransferCommand &cmd) const;
        dp::Result<TransferResult, dp::Error> applyOnce(TransferKind kind, const TransferCommand &cmd);
        dp::Result<std::optional<TransferResult>, dp::Error> lookupReplay(const std::string &key);

        storage::Database &db_;
        LedgerConfig config_;
        Logger log_;

        WalletRegistry wallets_;
        LockCoordinator locks_;
        BalanceCalculator balances_;
        IdempotencyGuard guard_;
    };

} // namespace coffer::ledger
