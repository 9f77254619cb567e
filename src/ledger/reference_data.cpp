#include <coffer/common/error.hpp>
#include <coffer/common/ids.hpp>
#include <coffer/ledger/reference_data.hpp>

#include <sqlite3.h>

namespace coffer::ledger {

    namespace {

        constexpr const char *ASSET_COLUMNS = "SELECT id, name, symbol, description, created_at FROM asset_types";
        constexpr const char *USER_COLUMNS = "SELECT id, username, email, is_system, created_at FROM users";

        AssetType readAssetType(const storage::Statement &stmt) {
            AssetType asset;
            asset.id = stmt.text(0);
            asset.name = stmt.text(1);
            asset.symbol = stmt.text(2);
            asset.description = stmt.optionalText(3);
            asset.created_at = stmt.int64(4);
            return asset;
        }

        User readUser(const storage::Statement &stmt) {
            User user;
            user.id = stmt.text(0);
            user.username = stmt.text(1);
            user.email = stmt.text(2);
            user.is_system = stmt.int64(3) != 0;
            user.created_at = stmt.int64(4);
            return user;
        }

        dp::Result<std::optional<AssetType>, dp::Error> findOneAsset(storage::Connection &conn,
                                                                     const std::string &where,
                                                                     const std::string &value) {
            auto stmt = conn.prepare(std::string(ASSET_COLUMNS) + " WHERE " + where + " = ?");
            stmt.bind(1, value);

            int rc = stmt.step();
            if (rc == SQLITE_ROW) {
                return dp::Result<std::optional<AssetType>, dp::Error>::ok(readAssetType(stmt));
            }
            if (rc != SQLITE_DONE) {
                return dp::Result<std::optional<AssetType>, dp::Error>::err(conn.errorFor(rc, "find asset type"));
            }
            return dp::Result<std::optional<AssetType>, dp::Error>::ok(std::nullopt);
        }

        dp::Result<std::optional<User>, dp::Error> findOneUser(storage::Connection &conn, const std::string &where,
                                                               const std::string &value) {
            auto stmt = conn.prepare(std::string(USER_COLUMNS) + " WHERE " + where + " = ?");
            stmt.bind(1, value);

            int rc = stmt.step();
            if (rc == SQLITE_ROW) {
                return dp::Result<std::optional<User>, dp::Error>::ok(readUser(stmt));
            }
            if (rc != SQLITE_DONE) {
                return dp::Result<std::optional<User>, dp::Error>::err(conn.errorFor(rc, "find user"));
            }
            return dp::Result<std::optional<User>, dp::Error>::ok(std::nullopt);
        }

    } // namespace

    // ===========================================
    // Asset types
    // ===========================================

    dp::Result<AssetType, dp::Error> ReferenceData::createAssetType(storage::Connection &conn, const std::string &name,
                                                                   const std::string &symbol,
                                                                   const std::optional<std::string> &description) {
        if (name.empty() || symbol.empty()) {
            return dp::Result<AssetType, dp::Error>::err(validation_error("Asset name and symbol are required"));
        }

        AssetType asset;
        asset.id = generateId();
        asset.name = name;
        asset.symbol = symbol;
        asset.description = description;
        asset.created_at = currentTimestampMs();

        auto stmt =
            conn.prepare("INSERT INTO asset_types (id, name, symbol, description, created_at) VALUES (?, ?, ?, ?, ?)");
        stmt.bind(1, asset.id).bind(2, asset.name).bind(3, asset.symbol).bind(4, asset.description).bind(5, asset.created_at);

        int rc = stmt.step();
        if (rc != SQLITE_DONE) {
            return dp::Result<AssetType, dp::Error>::err(conn.errorFor(rc, "create asset type " + symbol));
        }
        return dp::Result<AssetType, dp::Error>::ok(asset);
    }

    dp::Result<std::optional<AssetType>, dp::Error> ReferenceData::findAssetType(storage::Connection &conn,
                                                                                const std::string &id) {
        return findOneAsset(conn, "id", id);
    }

    dp::Result<std::optional<AssetType>, dp::Error> ReferenceData::findAssetTypeBySymbol(storage::Connection &conn,
                                                                                        const std::string &symbol) {
        return findOneAsset(conn, "symbol", symbol);
    }

    dp::Result<std::vector<AssetType>, dp::Error> ReferenceData::listAssetTypes(storage::Connection &conn) {
        std::vector<AssetType> assets;
        auto stmt = conn.prepare(std::string(ASSET_COLUMNS) + " ORDER BY name");

        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            assets.push_back(readAssetType(stmt));
        }
        if (rc != SQLITE_DONE) {
            return dp::Result<std::vector<AssetType>, dp::Error>::err(conn.errorFor(rc, "list asset types"));
        }
        return dp::Result<std::vector<AssetType>, dp::Error>::ok(std::move(assets));
    }

    // ===========================================
    // Users
    // ===========================================

    dp::Result<User, dp::Error> ReferenceData::createUser(storage::Connection &conn, const std::string &username,
                                                         const std::string &email, bool is_system) {
        if (username.empty() || email.empty()) {
            return dp::Result<User, dp::Error>::err(validation_error("Username and email are required"));
        }

        User user;
        user.id = generateId();
        user.username = username;
        user.email = email;
        user.is_system = is_system;
        user.created_at = currentTimestampMs();

        auto stmt =
            conn.prepare("INSERT INTO users (id, username, email, is_system, created_at) VALUES (?, ?, ?, ?, ?)");
        stmt.bind(1, user.id)
            .bind(2, user.username)
            .bind(3, user.email)
            .bind(4, int64_t{is_system ? 1 : 0})
            .bind(5, user.created_at);

        int rc = stmt.step();
        if (rc != SQLITE_DONE) {
            return dp::Result<User, dp::Error>::err(conn.errorFor(rc, "create user " + username));
        }
        return dp::Result<User, dp::Error>::ok(user);
    }

    dp::Result<std::optional<User>, dp::Error> ReferenceData::findUser(storage::Connection &conn,
                                                                      const std::string &id) {
        return findOneUser(conn, "id", id);
    }

    dp::Result<std::optional<User>, dp::Error> ReferenceData::findUserByUsername(storage::Connection &conn,
                                                                                const std::string &username) {
        return findOneUser(conn, "username", username);
    }

    dp::Result<std::vector<User>, dp::Error> ReferenceData::listUsers(storage::Connection &conn, bool include_system) {
        std::vector<User> users;
        auto stmt = conn.prepare(std::string(USER_COLUMNS) + (include_system ? "" : " WHERE is_system = 0") +
                                 " ORDER BY username");

        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            users.push_back(readUser(stmt));
        }
        if (rc != SQLITE_DONE) {
            return dp::Result<std::vector<User>, dp::Error>::err(conn.errorFor(rc, "list users"));
        }
        return dp::Result<std::vector<User>, dp::Error>::ok(std::move(users));
    }

    dp::Result<User, dp::Error> ReferenceData::findTreasuryUser(storage::Connection &conn) {
        auto stmt = conn.prepare(std::string(USER_COLUMNS) + " WHERE is_system = 1");

        int rc = stmt.step();
        if (rc == SQLITE_ROW) {
            return dp::Result<User, dp::Error>::ok(readUser(stmt));
        }
        if (rc != SQLITE_DONE) {
            return dp::Result<User, dp::Error>::err(conn.errorFor(rc, "find treasury user"));
        }
        return dp::Result<User, dp::Error>::err(not_found("No treasury (system) user configured"));
    }

} // namespace coffer::ledger
