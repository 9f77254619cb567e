#pragma once

#include <datapod/datapod.hpp>
#include <vector>

#include <coffer/common/config.hpp>
#include <coffer/common/log.hpp>
#include <coffer/ledger/ledger_queries.hpp>
#include <coffer/ledger/seed.hpp>
#include <coffer/ledger/transaction_coordinator.hpp>
#include <coffer/storage/database.hpp>

#include "requests.hpp"

namespace coffer::api {

    // ===========================================
    // WalletService - request-facing facade
    // ===========================================

    /// Validates raw requests, then hands them to the ledger core.
    /// The Database must outlive the service.
    class WalletService {
      public:
        explicit WalletService(storage::Database &db, LedgerConfig config = LedgerConfig{});

        dp::Result<ledger::TransferResult, dp::Error> topUp(const TransferRequest &request);
        dp::Result<ledger::TransferResult, dp::Error> bonus(const TransferRequest &request);
        dp::Result<ledger::TransferResult, dp::Error> spend(const TransferRequest &request);

        dp::Result<ledger::BalanceView, dp::Error> getBalance(const BalanceRequest &request);
        dp::Result<std::vector<ledger::HistoryItem>, dp::Error> getHistory(const HistoryRequest &request);

        dp::Result<std::vector<ledger::AssetType>, dp::Error> listAssetTypes();
        dp::Result<std::vector<ledger::User>, dp::Error> listUsers();

        /// Demo reference data and opening balances; safe to call repeatedly
        dp::Result<ledger::SeedResult, dp::Error> seedDefaults();

        /// Hash chain intact and every asset balanced
        dp::Result<ledger::AuditReport, dp::Error> verifyIntegrity();

        ledger::TransactionCoordinator &coordinator() { return coordinator_; }
        ledger::LedgerQueries &queries() { return queries_; }

      private:
        dp::Result<ledger::TransferResult, dp::Error> transfer(ledger::TransferKind kind,
                                                               const TransferRequest &request);

        storage::Database &db_;
        LedgerConfig config_;
        Logger log_;
        ledger::TransactionCoordinator coordinator_;
        ledger::LedgerQueries queries_;
    };

} // namespace coffer::api
