#pragma once

#include <datapod/datapod.hpp>
#include <sqlite3.h>
#include <string>
#include <vector>

#include <coffer/common/amount.hpp>
#include <coffer/storage/connection.hpp>

#include "types.hpp"

namespace coffer::ledger {

    /// Balance = sum of credits - sum of debits. Never cached, always derived.
    class BalanceCalculator {
      public:
        BalanceCalculator() = default;

        /// Balance of `wallet_id` as seen by `conn`. Unknown wallets are zero.
        /// For balance-gated decisions call this only after the wallet lock is held.
        inline dp::Result<Amount, dp::Error> balanceOf(storage::Connection &conn, const std::string &wallet_id) const {
            auto stmt = conn.prepare("SELECT COALESCE(SUM(CASE WHEN credit_wallet_id = ?1 THEN amount ELSE 0 END) - "
                                     "SUM(CASE WHEN debit_wallet_id = ?1 THEN amount ELSE 0 END), 0) "
                                     "FROM ledger_entries WHERE credit_wallet_id = ?1 OR debit_wallet_id = ?1");
            stmt.bind(1, wallet_id);

            int rc = stmt.step();
            if (rc != SQLITE_ROW) {
                return dp::Result<Amount, dp::Error>::err(conn.errorFor(rc, "compute balance"));
            }
            return dp::Result<Amount, dp::Error>::ok(Amount::fromUnits(stmt.int64(0)));
        }

        /// Same rule applied to an in-memory history
        static inline Amount fold(const std::vector<LedgerEntry> &entries, const std::string &wallet_id) {
            Amount balance;
            for (const auto &entry : entries) {
                if (entry.credit_wallet_id == wallet_id)
                    balance += entry.amount;
                if (entry.debit_wallet_id == wallet_id)
                    balance -= entry.amount;
            }
            return balance;
        }
    };

} // namespace coffer::ledger
