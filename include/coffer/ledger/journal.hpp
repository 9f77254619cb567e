#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include <coffer/storage/connection.hpp>

#include "types.hpp"

namespace coffer::ledger {

    // ===========================================
    // LedgerJournal - append-only transaction and entry log
    // ===========================================

    /// Writes must run inside a Write unit of work; the unit's exclusive
    /// store lock keeps the audit chain tip stable while an entry is appended.
    class LedgerJournal {
      public:
        /// Insert a PENDING transaction
        static dp::Result<TransactionRecord, dp::Error> openTransaction(storage::Connection &conn, TransferKind kind,
                                                                       const std::optional<std::string> &description);

        /// PENDING -> COMPLETED. Any other starting state is an Internal error.
        static dp::Result<void, dp::Error> completeTransaction(storage::Connection &conn,
                                                              const std::string &transaction_id);

        /// Append `draft` to the log. Assigns id, timestamp, sequence and the
        /// chain hashes; the remaining fields are taken as given.
        /// A reused idempotency key fails with Conflict; an entry that would take
        /// the asset's lifetime volume past Amount::kMaxUnits fails with Validation.
        static dp::Result<LedgerEntry, dp::Error> appendEntry(storage::Connection &conn, LedgerEntry draft);

        static dp::Result<std::optional<LedgerEntry>, dp::Error> findEntryByKey(storage::Connection &conn,
                                                                               const std::string &idempotency_key);

        static dp::Result<std::optional<TransactionRecord>, dp::Error> findTransaction(storage::Connection &conn,
                                                                                      const std::string &id);

        /// Every entry in append order
        static dp::Result<std::vector<LedgerEntry>, dp::Error> allEntries(storage::Connection &conn);

        /// Entries debiting or crediting the wallet, in append order
        static dp::Result<std::vector<LedgerEntry>, dp::Error> entriesForWallet(storage::Connection &conn,
                                                                               const std::string &wallet_id);

        /// entry_hash of the newest entry, or the genesis hash for an empty log
        static dp::Result<std::string, dp::Error> chainTip(storage::Connection &conn);
    };

} // namespace coffer::ledger
