#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

#include <coffer/common/error.hpp>
#include <coffer/common/ids.hpp>
#include <coffer/storage/unit_of_work.hpp>

#include "reference_data.hpp"
#include "types.hpp"

namespace coffer::ledger {

    /// Resolves the unique wallet for a (user, asset) pair, creating it on first touch
    class WalletRegistry {
      public:
        WalletRegistry() = default;

        /// Existing wallet, or a new one created inside `unit`.
        /// A concurrent first touch is absorbed by the (user, asset) unique key:
        /// the insert becomes a no-op and the row is re-read.
        inline dp::Result<Wallet, dp::Error> resolve(storage::UnitOfWork &unit, const std::string &user_id,
                                                     const std::string &asset_type_id) const {
            if (unit.mode() != storage::UnitMode::Write) {
                return dp::Result<Wallet, dp::Error>::err(internal_error("Wallet resolution needs a write unit"));
            }
            auto &conn = unit.connection();

            auto existing = find(conn, user_id, asset_type_id);
            if (!existing.is_ok()) {
                return dp::Result<Wallet, dp::Error>::err(existing.error());
            }
            if (existing.value().has_value()) {
                return dp::Result<Wallet, dp::Error>::ok(*existing.value());
            }

            auto user = ReferenceData::findUser(conn, user_id);
            if (!user.is_ok()) {
                return dp::Result<Wallet, dp::Error>::err(user.error());
            }
            if (!user.value().has_value()) {
                return dp::Result<Wallet, dp::Error>::err(not_found("User not found: " + user_id));
            }

            auto asset = ReferenceData::findAssetType(conn, asset_type_id);
            if (!asset.is_ok()) {
                return dp::Result<Wallet, dp::Error>::err(asset.error());
            }
            if (!asset.value().has_value()) {
                return dp::Result<Wallet, dp::Error>::err(not_found("Asset type not found: " + asset_type_id));
            }

            auto insert = conn.prepare("INSERT INTO wallets (id, user_id, asset_type_id, created_at) VALUES (?, ?, ?, ?) "
                                       "ON CONFLICT(user_id, asset_type_id) DO NOTHING");
            insert.bind(1, generateId()).bind(2, user_id).bind(3, asset_type_id).bind(4, currentTimestampMs());
            int rc = insert.step();
            if (rc != SQLITE_DONE) {
                return dp::Result<Wallet, dp::Error>::err(conn.errorFor(rc, "create wallet"));
            }

            auto created = find(conn, user_id, asset_type_id);
            if (!created.is_ok()) {
                return dp::Result<Wallet, dp::Error>::err(created.error());
            }
            if (!created.value().has_value()) {
                return dp::Result<Wallet, dp::Error>::err(internal_error("Wallet vanished after creation"));
            }
            return dp::Result<Wallet, dp::Error>::ok(*created.value());
        }

        /// The treasury user's wallet for the asset. NotFound without a treasury user.
        inline dp::Result<Wallet, dp::Error> resolveTreasury(storage::UnitOfWork &unit,
                                                             const std::string &asset_type_id) const {
            auto treasury = ReferenceData::findTreasuryUser(unit.connection());
            if (!treasury.is_ok()) {
                return dp::Result<Wallet, dp::Error>::err(treasury.error());
            }
            return resolve(unit, treasury.value().id, asset_type_id);
        }

        /// Read-only lookup; never creates
        inline dp::Result<std::optional<Wallet>, dp::Error> find(storage::Connection &conn, const std::string &user_id,
                                                                const std::string &asset_type_id) const {
            auto stmt = conn.prepare(
                "SELECT id, user_id, asset_type_id, created_at FROM wallets WHERE user_id = ? AND asset_type_id = ?");
            stmt.bind(1, user_id).bind(2, asset_type_id);

            int rc = stmt.step();
            if (rc == SQLITE_ROW) {
                return dp::Result<std::optional<Wallet>, dp::Error>::ok(readWallet(stmt));
            }
            if (rc != SQLITE_DONE) {
                return dp::Result<std::optional<Wallet>, dp::Error>::err(conn.errorFor(rc, "find wallet"));
            }
            return dp::Result<std::optional<Wallet>, dp::Error>::ok(std::nullopt);
        }

        /// All wallets of a user, optionally restricted to one asset
        inline dp::Result<std::vector<Wallet>, dp::Error>
        walletsOf(storage::Connection &conn, const std::string &user_id,
                  const std::optional<std::string> &asset_type_id = std::nullopt) const {
            std::vector<Wallet> wallets;
            auto stmt = conn.prepare("SELECT id, user_id, asset_type_id, created_at FROM wallets "
                                     "WHERE user_id = ?1 AND (?2 IS NULL OR asset_type_id = ?2) ORDER BY id");
            stmt.bind(1, user_id).bind(2, asset_type_id);

            int rc;
            while ((rc = stmt.step()) == SQLITE_ROW) {
                wallets.push_back(readWallet(stmt));
            }
            if (rc != SQLITE_DONE) {
                return dp::Result<std::vector<Wallet>, dp::Error>::err(conn.errorFor(rc, "list wallets"));
            }
            return dp::Result<std::vector<Wallet>, dp::Error>::ok(std::move(wallets));
        }

      private:
        static inline Wallet readWallet(const storage::Statement &stmt) {
            Wallet wallet;
            wallet.id = stmt.text(0);
            wallet.user_id = stmt.text(1);
            wallet.asset_type_id = stmt.text(2);
            wallet.created_at = stmt.int64(3);
            return wallet;
        }
    };

} // namespace coffer::ledger
