#include <coffer/common/error.hpp>
#include <coffer/ledger/ledger_queries.hpp>
#include <coffer/ledger/reference_data.hpp>
#include <coffer/storage/unit_of_work.hpp>

#include <sqlite3.h>

namespace coffer::ledger {

    LedgerQueries::LedgerQueries(storage::Database &db, LedgerConfig config) : db_(db), config_(config) {}

    dp::Result<BalanceView, dp::Error> LedgerQueries::getBalance(const std::string &user_id,
                                                                 const std::string &asset_type_id) {
        auto unit = db_.beginUnit(storage::UnitMode::Read, config_.unit_timeout);
        auto begun = unit->begin();
        if (!begun.is_ok()) {
            return dp::Result<BalanceView, dp::Error>::err(begun.error());
        }
        auto &conn = unit->connection();

        auto asset = ReferenceData::findAssetType(conn, asset_type_id);
        if (!asset.is_ok()) {
            return dp::Result<BalanceView, dp::Error>::err(asset.error());
        }
        if (!asset.value().has_value()) {
            return dp::Result<BalanceView, dp::Error>::err(not_found("Asset type not found: " + asset_type_id));
        }

        BalanceView view;
        view.user_id = user_id;
        view.asset_type_id = asset_type_id;
        view.asset_name = asset.value()->name;
        view.asset_symbol = asset.value()->symbol;

        auto wallet = wallets_.find(conn, user_id, asset_type_id);
        if (!wallet.is_ok()) {
            return dp::Result<BalanceView, dp::Error>::err(wallet.error());
        }
        if (wallet.value().has_value()) {
            auto balance = balances_.balanceOf(conn, wallet.value()->id);
            if (!balance.is_ok()) {
                return dp::Result<BalanceView, dp::Error>::err(balance.error());
            }
            view.balance = balance.value();
        }

        unit->rollback();
        return dp::Result<BalanceView, dp::Error>::ok(view);
    }

    dp::Result<std::vector<HistoryItem>, dp::Error>
    LedgerQueries::getHistory(const std::string &user_id, const std::optional<std::string> &asset_type_id) {
        auto unit = db_.beginUnit(storage::UnitMode::Read, config_.unit_timeout);
        auto begun = unit->begin();
        if (!begun.is_ok()) {
            return dp::Result<std::vector<HistoryItem>, dp::Error>::err(begun.error());
        }
        auto &conn = unit->connection();

        auto stmt = conn.prepare(
            "SELECT e.id, e.kind, t.status, e.amount, e.description, e.created_at, e.debit_wallet_id, "
            "e.credit_wallet_id "
            "FROM ledger_entries e JOIN transactions t ON t.id = e.transaction_id "
            "WHERE e.debit_wallet_id IN (SELECT id FROM wallets WHERE user_id = ?1 AND (?2 IS NULL OR asset_type_id = ?2)) "
            "OR e.credit_wallet_id IN (SELECT id FROM wallets WHERE user_id = ?1 AND (?2 IS NULL OR asset_type_id = ?2)) "
            "ORDER BY e.created_at DESC, e.sequence DESC LIMIT ?3");
        stmt.bind(1, user_id).bind(2, asset_type_id).bind(3, static_cast<int64_t>(config_.history_limit));

        std::vector<HistoryItem> items;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            HistoryItem item;
            item.id = stmt.text(0);
            item.kind = transferKindFromString(stmt.text(1)).value_or(TransferKind::TopUp);
            item.status = txStatusFromString(stmt.text(2)).value_or(TxStatus::Pending);
            item.amount = Amount::fromUnits(stmt.int64(3));
            item.description = stmt.optionalText(4);
            item.created_at = stmt.int64(5);
            item.debit_wallet_id = stmt.text(6);
            item.credit_wallet_id = stmt.text(7);
            items.push_back(item);
        }
        if (rc != SQLITE_DONE) {
            return dp::Result<std::vector<HistoryItem>, dp::Error>::err(conn.errorFor(rc, "read history"));
        }

        unit->rollback();
        return dp::Result<std::vector<HistoryItem>, dp::Error>::ok(std::move(items));
    }

    dp::Result<std::vector<AssetType>, dp::Error> LedgerQueries::listAssetTypes() {
        auto unit = db_.beginUnit(storage::UnitMode::Read, config_.unit_timeout);
        auto begun = unit->begin();
        if (!begun.is_ok()) {
            return dp::Result<std::vector<AssetType>, dp::Error>::err(begun.error());
        }
        return ReferenceData::listAssetTypes(unit->connection());
    }

    dp::Result<std::vector<User>, dp::Error> LedgerQueries::listUsers() {
        auto unit = db_.beginUnit(storage::UnitMode::Read, config_.unit_timeout);
        auto begun = unit->begin();
        if (!begun.is_ok()) {
            return dp::Result<std::vector<User>, dp::Error>::err(begun.error());
        }
        return ReferenceData::listUsers(unit->connection());
    }

    dp::Result<AuditReport, dp::Error> LedgerQueries::verifyAuditChain() {
        auto unit = db_.beginUnit(storage::UnitMode::Read, config_.unit_timeout);
        auto begun = unit->begin();
        if (!begun.is_ok()) {
            return dp::Result<AuditReport, dp::Error>::err(begun.error());
        }
        return AuditChain::verify(unit->connection());
    }

    dp::Result<void, dp::Error> LedgerQueries::verifyZeroSum() {
        auto unit = db_.beginUnit(storage::UnitMode::Read, config_.unit_timeout);
        auto begun = unit->begin();
        if (!begun.is_ok()) {
            return begun;
        }
        return AuditChain::verifyZeroSum(unit->connection());
    }

} // namespace coffer::ledger
