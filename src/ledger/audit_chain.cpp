#include <coffer/common/error.hpp>
#include <coffer/ledger/audit_chain.hpp>
#include <coffer/ledger/journal.hpp>

#include <keylock/keylock.hpp>
#include <sqlite3.h>
#include <sstream>

namespace coffer::ledger {

    namespace {

        // Length-prefixed so that no two field lists share a rendering
        void appendField(std::ostringstream &ss, const std::string &value) { ss << value.size() << ':' << value << ';'; }

        void appendField(std::ostringstream &ss, const std::optional<std::string> &value) {
            if (value) {
                appendField(ss, *value);
            } else {
                ss << "~;";
            }
        }

    } // namespace

    std::string AuditChain::genesisHash() { return std::string(64, '0'); }

    std::string AuditChain::canonicalForm(const LedgerEntry &entry) {
        std::ostringstream ss;
        appendField(ss, entry.prev_hash);
        appendField(ss, entry.id);
        appendField(ss, entry.transaction_id);
        appendField(ss, entry.asset_type_id);
        appendField(ss, entry.debit_wallet_id);
        appendField(ss, entry.credit_wallet_id);
        ss << entry.amount.units() << ';';
        appendField(ss, transferKindToString(entry.kind));
        appendField(ss, entry.description);
        appendField(ss, entry.idempotency_key);
        appendField(ss, entry.metadata);
        if (entry.resulting_balance) {
            ss << entry.resulting_balance->units() << ';';
        } else {
            ss << "~;";
        }
        ss << entry.created_at;
        return ss.str();
    }

    dp::Result<std::string, dp::Error> AuditChain::computeEntryHash(const LedgerEntry &entry) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::string data = canonicalForm(entry);
        std::vector<dp::u8> data_vec(data.begin(), data.end());
        auto hash_result = crypto.hash(data_vec);
        if (hash_result.success)
            return dp::Result<std::string, dp::Error>::ok(keylock::keylock::to_hex(hash_result.data));
        else
            return dp::Result<std::string, dp::Error>::err(internal_error("Failed to hash ledger entry " + entry.id));
    }

    dp::Result<AuditReport, dp::Error> AuditChain::verifyEntries(const std::vector<LedgerEntry> &entries) {
        AuditReport report;
        std::string expected_prev = genesisHash();

        for (const auto &entry : entries) {
            if (entry.prev_hash != expected_prev) {
                report.intact = false;
                report.first_broken_sequence = entry.sequence;
                report.reason = "Chain link broken at entry " + entry.id;
                return dp::Result<AuditReport, dp::Error>::ok(report);
            }

            auto hash = computeEntryHash(entry);
            if (!hash.is_ok()) {
                return dp::Result<AuditReport, dp::Error>::err(hash.error());
            }
            if (hash.value() != entry.entry_hash) {
                report.intact = false;
                report.first_broken_sequence = entry.sequence;
                report.reason = "Hash mismatch at entry " + entry.id;
                return dp::Result<AuditReport, dp::Error>::ok(report);
            }

            expected_prev = entry.entry_hash;
            report.entries_checked++;
        }

        return dp::Result<AuditReport, dp::Error>::ok(report);
    }

    dp::Result<AuditReport, dp::Error> AuditChain::verify(storage::Connection &conn) {
        auto entries = LedgerJournal::allEntries(conn);
        if (!entries.is_ok()) {
            return dp::Result<AuditReport, dp::Error>::err(entries.error());
        }
        return verifyEntries(entries.value());
    }

    dp::Result<std::vector<AssetTotals>, dp::Error> AuditChain::zeroSumTotals(storage::Connection &conn) {
        std::vector<AssetTotals> totals;
        auto stmt = conn.prepare("SELECT asset_type_id, SUM(credit), SUM(debit) FROM ("
                                 "  SELECT w.asset_type_id AS asset_type_id, e.amount AS credit, 0 AS debit "
                                 "  FROM ledger_entries e JOIN wallets w ON w.id = e.credit_wallet_id "
                                 "  UNION ALL "
                                 "  SELECT w.asset_type_id, 0, e.amount "
                                 "  FROM ledger_entries e JOIN wallets w ON w.id = e.debit_wallet_id"
                                 ") GROUP BY asset_type_id ORDER BY asset_type_id");

        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            AssetTotals row;
            row.asset_type_id = stmt.text(0);
            row.credits = Amount::fromUnits(stmt.int64(1));
            row.debits = Amount::fromUnits(stmt.int64(2));
            totals.push_back(row);
        }
        if (rc != SQLITE_DONE) {
            return dp::Result<std::vector<AssetTotals>, dp::Error>::err(conn.errorFor(rc, "zero-sum totals"));
        }
        return dp::Result<std::vector<AssetTotals>, dp::Error>::ok(std::move(totals));
    }

    dp::Result<void, dp::Error> AuditChain::verifyZeroSum(storage::Connection &conn) {
        auto stmt = conn.prepare("SELECT COUNT(*) FROM ledger_entries e "
                                 "JOIN wallets d ON d.id = e.debit_wallet_id "
                                 "JOIN wallets c ON c.id = e.credit_wallet_id "
                                 "WHERE d.asset_type_id <> e.asset_type_id OR c.asset_type_id <> e.asset_type_id");
        int rc = stmt.step();
        if (rc != SQLITE_ROW) {
            return dp::Result<void, dp::Error>::err(conn.errorFor(rc, "cross-asset check"));
        }
        if (stmt.int64(0) > 0) {
            return dp::Result<void, dp::Error>::err(
                internal_error(std::to_string(stmt.int64(0)) + " entries move value across assets"));
        }

        auto totals = zeroSumTotals(conn);
        if (!totals.is_ok()) {
            return dp::Result<void, dp::Error>::err(totals.error());
        }
        for (const auto &row : totals.value()) {
            if (!row.balanced()) {
                return dp::Result<void, dp::Error>::err(internal_error(
                    "Asset " + row.asset_type_id + " out of balance: credits " + row.credits.toString() +
                    ", debits " + row.debits.toString()));
            }
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace coffer::ledger
