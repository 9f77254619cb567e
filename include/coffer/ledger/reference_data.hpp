#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include <coffer/storage/connection.hpp>

#include "types.hpp"

namespace coffer::ledger {

    /// Asset types and users. Rarely written, read on every transfer.
    /// Writes must run inside a Write unit of work.
    class ReferenceData {
      public:
        // ===========================================
        // Asset types
        // ===========================================

        /// Insert a new asset type. Duplicate name or symbol -> Conflict.
        static dp::Result<AssetType, dp::Error> createAssetType(storage::Connection &conn, const std::string &name,
                                                               const std::string &symbol,
                                                               const std::optional<std::string> &description = {});

        static dp::Result<std::optional<AssetType>, dp::Error> findAssetType(storage::Connection &conn,
                                                                            const std::string &id);

        static dp::Result<std::optional<AssetType>, dp::Error> findAssetTypeBySymbol(storage::Connection &conn,
                                                                                    const std::string &symbol);

        /// All asset types ordered by name
        static dp::Result<std::vector<AssetType>, dp::Error> listAssetTypes(storage::Connection &conn);

        // ===========================================
        // Users
        // ===========================================

        /// Insert a new user. A second system user, or duplicate username/email -> Conflict.
        static dp::Result<User, dp::Error> createUser(storage::Connection &conn, const std::string &username,
                                                     const std::string &email, bool is_system = false);

        static dp::Result<std::optional<User>, dp::Error> findUser(storage::Connection &conn, const std::string &id);

        static dp::Result<std::optional<User>, dp::Error> findUserByUsername(storage::Connection &conn,
                                                                            const std::string &username);

        /// Users ordered by username; the treasury only when `include_system`
        static dp::Result<std::vector<User>, dp::Error> listUsers(storage::Connection &conn,
                                                                 bool include_system = false);

        /// The single system (treasury) user. NotFound when the deployment has none.
        static dp::Result<User, dp::Error> findTreasuryUser(storage::Connection &conn);
    };

} // namespace coffer::ledger
