#include <coffer/common/error.hpp>
#include <coffer/common/ids.hpp>
#include <coffer/ledger/audit_chain.hpp>
#include <coffer/ledger/journal.hpp>

#include <sqlite3.h>

namespace coffer::ledger {

    namespace {

        constexpr const char *ENTRY_COLUMNS =
            "SELECT sequence, id, transaction_id, asset_type_id, debit_wallet_id, credit_wallet_id, amount, kind, "
            "description, idempotency_key, metadata, resulting_balance, prev_hash, entry_hash, created_at "
            "FROM ledger_entries";

        LedgerEntry readEntry(const storage::Statement &stmt) {
            LedgerEntry entry;
            entry.sequence = stmt.int64(0);
            entry.id = stmt.text(1);
            entry.transaction_id = stmt.text(2);
            entry.asset_type_id = stmt.text(3);
            entry.debit_wallet_id = stmt.text(4);
            entry.credit_wallet_id = stmt.text(5);
            entry.amount = Amount::fromUnits(stmt.int64(6));
            entry.kind = transferKindFromString(stmt.text(7)).value_or(TransferKind::TopUp);
            entry.description = stmt.optionalText(8);
            entry.idempotency_key = stmt.optionalText(9);
            entry.metadata = stmt.optionalText(10);
            if (auto units = stmt.optionalInt64(11)) {
                entry.resulting_balance = Amount::fromUnits(*units);
            }
            entry.prev_hash = stmt.text(12);
            entry.entry_hash = stmt.text(13);
            entry.created_at = stmt.int64(14);
            return entry;
        }

        dp::Result<std::vector<LedgerEntry>, dp::Error> collectEntries(storage::Connection &conn,
                                                                       storage::Statement &stmt,
                                                                       const std::string &context) {
            std::vector<LedgerEntry> entries;
            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                entries.push_back(readEntry(stmt));
            }
            if (rc != SQLITE_DONE) {
                return dp::Result<std::vector<LedgerEntry>, dp::Error>::err(conn.errorFor(rc, context));
            }
            return dp::Result<std::vector<LedgerEntry>, dp::Error>::ok(std::move(entries));
        }

    } // namespace

    // ===========================================
    // Transactions
    // ===========================================

    dp::Result<TransactionRecord, dp::Error>
    LedgerJournal::openTransaction(storage::Connection &conn, TransferKind kind,
                                   const std::optional<std::string> &description) {
        TransactionRecord record;
        record.id = generateId();
        record.kind = kind;
        record.status = TxStatus::Pending;
        record.description = description;
        record.created_at = currentTimestampMs();
        record.updated_at = record.created_at;

        auto stmt = conn.prepare("INSERT INTO transactions (id, kind, status, description, created_at, updated_at) "
                                 "VALUES (?, ?, ?, ?, ?, ?)");
        stmt.bind(1, record.id)
            .bind(2, transferKindToString(kind))
            .bind(3, txStatusToString(TxStatus::Pending))
            .bind(4, description)
            .bind(5, record.created_at)
            .bind(6, record.updated_at);

        int rc = stmt.step();
        if (rc != SQLITE_DONE) {
            return dp::Result<TransactionRecord, dp::Error>::err(conn.errorFor(rc, "open transaction"));
        }
        return dp::Result<TransactionRecord, dp::Error>::ok(record);
    }

    dp::Result<void, dp::Error> LedgerJournal::completeTransaction(storage::Connection &conn,
                                                                  const std::string &transaction_id) {
        auto stmt = conn.prepare("UPDATE transactions SET status = ?, updated_at = ? WHERE id = ? AND status = ?");
        stmt.bind(1, txStatusToString(TxStatus::Completed))
            .bind(2, currentTimestampMs())
            .bind(3, transaction_id)
            .bind(4, txStatusToString(TxStatus::Pending));

        int rc = stmt.step();
        if (rc != SQLITE_DONE) {
            return dp::Result<void, dp::Error>::err(conn.errorFor(rc, "complete transaction"));
        }
        if (conn.changes() != 1) {
            return dp::Result<void, dp::Error>::err(
                internal_error("Transaction " + transaction_id + " is not pending"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::optional<TransactionRecord>, dp::Error> LedgerJournal::findTransaction(storage::Connection &conn,
                                                                                          const std::string &id) {
        auto stmt =
            conn.prepare("SELECT id, kind, status, description, created_at, updated_at FROM transactions WHERE id = ?");
        stmt.bind(1, id);

        int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            TransactionRecord record;
            record.id = stmt.text(0);
            record.kind = transferKindFromString(stmt.text(1)).value_or(TransferKind::TopUp);
            record.status = txStatusFromString(stmt.text(2)).value_or(TxStatus::Pending);
            record.description = stmt.optionalText(3);
            record.created_at = stmt.int64(4);
            record.updated_at = stmt.int64(5);
            return dp::Result<std::optional<TransactionRecord>, dp::Error>::ok(record);
        }
        if (rc != SQLITE_DONE) {
            return dp::Result<std::optional<TransactionRecord>, dp::Error>::err(conn.errorFor(rc, "find transaction"));
        }
        return dp::Result<std::optional<TransactionRecord>, dp::Error>::ok(std::nullopt);
    }

    // ===========================================
    // Ledger entries
    // ===========================================

    dp::Result<LedgerEntry, dp::Error> LedgerJournal::appendEntry(storage::Connection &conn, LedgerEntry draft) {
        if (!draft.amount.isPositive()) {
            return dp::Result<LedgerEntry, dp::Error>::err(validation_error("Amount must be positive"));
        }
        if (draft.debit_wallet_id == draft.credit_wallet_id) {
            return dp::Result<LedgerEntry, dp::Error>::err(
                validation_error("Debit and credit wallet must differ"));
        }

        auto tip = chainTip(conn);
        if (!tip.is_ok()) {
            return dp::Result<LedgerEntry, dp::Error>::err(tip.error());
        }

        draft.id = generateId();
        draft.created_at = currentTimestampMs();
        draft.prev_hash = tip.value();

        auto hash = AuditChain::computeEntryHash(draft);
        if (!hash.is_ok()) {
            return dp::Result<LedgerEntry, dp::Error>::err(hash.error());
        }
        draft.entry_hash = hash.value();

        std::optional<int64_t> resulting_units;
        if (draft.resulting_balance) {
            resulting_units = draft.resulting_balance->units();
        }

        auto stmt = conn.prepare(
            "INSERT INTO ledger_entries (id, transaction_id, asset_type_id, debit_wallet_id, credit_wallet_id, amount, "
            "kind, description, idempotency_key, metadata, resulting_balance, prev_hash, entry_hash, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        stmt.bind(1, draft.id)
            .bind(2, draft.transaction_id)
            .bind(3, draft.asset_type_id)
            .bind(4, draft.debit_wallet_id)
            .bind(5, draft.credit_wallet_id)
            .bind(6, draft.amount.units())
            .bind(7, transferKindToString(draft.kind))
            .bind(8, draft.description)
            .bind(9, draft.idempotency_key)
            .bind(10, draft.metadata)
            .bind(11, resulting_units)
            .bind(12, draft.prev_hash)
            .bind(13, draft.entry_hash)
            .bind(14, draft.created_at);

        int rc = stmt.step();
        if (rc != SQLITE_DONE) {
            return dp::Result<LedgerEntry, dp::Error>::err(conn.errorFor(rc, "append ledger entry"));
        }

        draft.sequence = conn.lastInsertRowId();

        // Checked after the insert so a reused key still reports Conflict. The
        // committed volume never exceeds kMaxUnits, so this sum cannot overflow.
        auto volume = conn.prepare("SELECT COALESCE(SUM(amount), 0) FROM ledger_entries WHERE asset_type_id = ?");
        volume.bind(1, draft.asset_type_id);
        rc = volume.step();
        if (rc != SQLITE_ROW) {
            return dp::Result<LedgerEntry, dp::Error>::err(conn.errorFor(rc, "asset volume"));
        }
        if (volume.int64(0) > Amount::kMaxUnits) {
            return dp::Result<LedgerEntry, dp::Error>::err(
                validation_error("Transfer of " + draft.amount.toString() +
                                 " would exceed the lifetime volume of asset " + draft.asset_type_id));
        }

        return dp::Result<LedgerEntry, dp::Error>::ok(draft);
    }

    dp::Result<std::optional<LedgerEntry>, dp::Error> LedgerJournal::findEntryByKey(storage::Connection &conn,
                                                                                   const std::string &idempotency_key) {
        auto stmt = conn.prepare(std::string(ENTRY_COLUMNS) + " WHERE idempotency_key = ?");
        stmt.bind(1, idempotency_key);

        int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            return dp::Result<std::optional<LedgerEntry>, dp::Error>::ok(readEntry(stmt));
        }
        if (rc != SQLITE_DONE) {
            return dp::Result<std::optional<LedgerEntry>, dp::Error>::err(conn.errorFor(rc, "find entry by key"));
        }
        return dp::Result<std::optional<LedgerEntry>, dp::Error>::ok(std::nullopt);
    }

    dp::Result<std::vector<LedgerEntry>, dp::Error> LedgerJournal::allEntries(storage::Connection &conn) {
        auto stmt = conn.prepare(std::string(ENTRY_COLUMNS) + " ORDER BY sequence");
        return collectEntries(conn, stmt, "list entries");
    }

    dp::Result<std::vector<LedgerEntry>, dp::Error> LedgerJournal::entriesForWallet(storage::Connection &conn,
                                                                                   const std::string &wallet_id) {
        auto stmt = conn.prepare(std::string(ENTRY_COLUMNS) +
                                 " WHERE debit_wallet_id = ?1 OR credit_wallet_id = ?1 ORDER BY sequence");
        stmt.bind(1, wallet_id);
        return collectEntries(conn, stmt, "list wallet entries");
    }

    dp::Result<std::string, dp::Error> LedgerJournal::chainTip(storage::Connection &conn) {
        auto stmt = conn.prepare("SELECT entry_hash FROM ledger_entries ORDER BY sequence DESC LIMIT 1");

        int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            return dp::Result<std::string, dp::Error>::ok(stmt.text(0));
        }
        if (rc != SQLITE_DONE) {
            return dp::Result<std::string, dp::Error>::err(conn.errorFor(rc, "read chain tip"));
        }
        return dp::Result<std::string, dp::Error>::ok(AuditChain::genesisHash());
    }

} // namespace coffer::ledger
