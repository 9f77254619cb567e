#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include <coffer/common/config.hpp>
#include <coffer/storage/database.hpp>

#include "audit_chain.hpp"
#include "balance_calculator.hpp"
#include "types.hpp"
#include "wallet_registry.hpp"

namespace coffer::ledger {

    /// Read-only views over the ledger. Each call runs in its own read unit
    /// and never creates wallets.
    class LedgerQueries {
      public:
        explicit LedgerQueries(storage::Database &db, LedgerConfig config = LedgerConfig{});

        /// Balance with asset metadata. Unknown asset -> NotFound; no wallet yet -> zero.
        dp::Result<BalanceView, dp::Error> getBalance(const std::string &user_id, const std::string &asset_type_id);

        /// Newest first, at most LedgerConfig::history_limit items
        dp::Result<std::vector<HistoryItem>, dp::Error>
        getHistory(const std::string &user_id, const std::optional<std::string> &asset_type_id = std::nullopt);

        dp::Result<std::vector<AssetType>, dp::Error> listAssetTypes();

        /// Non-system users ordered by username
        dp::Result<std::vector<User>, dp::Error> listUsers();

        /// Recompute the hash chain over every stored entry
        dp::Result<AuditReport, dp::Error> verifyAuditChain();

        /// Per-asset credits equal debits
        dp::Result<void, dp::Error> verifyZeroSum();

      private:
        storage::Database &db_;
        LedgerConfig config_;
        WalletRegistry wallets_;
        BalanceCalculator balances_;
    };

} // namespace coffer::ledger
