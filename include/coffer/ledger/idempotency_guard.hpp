#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>

#include <coffer/storage/connection.hpp>

#include "journal.hpp"
#include "types.hpp"

namespace coffer::ledger {

    /// Replay lookup for idempotency keys. This is only the fast path: the
    /// UNIQUE constraint on ledger_entries.idempotency_key is what guarantees
    /// a key commits at most once.
    class IdempotencyGuard {
      public:
        IdempotencyGuard() = default;

        /// The original result, marked as a replay, if an entry with `key` is committed
        inline dp::Result<std::optional<TransferResult>, dp::Error> checkReplay(storage::Connection &conn,
                                                                               const std::string &key) const {
            auto found = LedgerJournal::findEntryByKey(conn, key);
            if (!found.is_ok()) {
                return dp::Result<std::optional<TransferResult>, dp::Error>::err(found.error());
            }
            if (!found.value().has_value()) {
                return dp::Result<std::optional<TransferResult>, dp::Error>::ok(std::nullopt);
            }
            return dp::Result<std::optional<TransferResult>, dp::Error>::ok(replayOf(*found.value()));
        }

        /// Rebuild the result the first submission returned
        static inline TransferResult replayOf(const LedgerEntry &entry) {
            TransferResult result;
            result.transaction_id = entry.transaction_id;
            result.entry_id = entry.id;
            result.kind = entry.kind;
            result.amount = entry.amount;
            if (entry.kind == TransferKind::Spend) {
                result.remaining_balance = entry.resulting_balance;
            }
            result.replay = true;
            return result;
        }
    };

} // namespace coffer::ledger
