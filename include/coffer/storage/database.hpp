#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "connection.hpp"
#include "keyed_lock_table.hpp"

namespace coffer::storage {

    class UnitOfWork;

    /// SQLite database configuration
    struct OpenOptions {
        bool enable_wal = true;
        bool enable_foreign_keys = true;
        /// Busy wait outside units of work; a unit waits until its own deadline instead
        int32_t busy_timeout_ms = 5000;
        int32_t cache_size_kb = 20000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;
        /// Number of pooled connections; forced to 1 for ":memory:"
        int32_t pool_size = 4;

        OpenOptions() = default;
    };

    enum class UnitMode {
        Read,  // BEGIN DEFERRED, snapshot reads
        Write, // BEGIN IMMEDIATE, takes the database write lock up front
    };

    // ===========================================
    // Database - ledger store
    // ===========================================

    /// Owns the pooled SQLite connections and the keyed lock table.
    /// All reads and writes go through a UnitOfWork obtained from beginUnit().
    class Database {
      public:
        Database();
        ~Database();

        Database(const Database &) = delete;
        Database &operator=(const Database &) = delete;

        /// Open or create database at given path
        /// @param path Database file path (e.g. "data/coffer.db")
        /// @param opts Configuration options
        dp::Result<void, dp::Error> open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        /// Close all pooled connections. Outstanding units must be finished first.
        void close();

        bool isOpen() const;

        const std::string &path() const { return path_; }

        /// Create the ledger schema and run migrations. Idempotent.
        dp::Result<void, dp::Error> initializeSchema();

        /// Current schema version, 0 when uninitialized
        dp::Result<int32_t, dp::Error> schemaVersion();

        /// Create a unit of work; call begin() on it before use
        std::unique_ptr<UnitOfWork> beginUnit(UnitMode mode, std::chrono::milliseconds timeout);

        KeyedLockTable &locks() { return locks_; }

        // ===========================================
        // Statistics & Diagnostics
        // ===========================================

        dp::Result<int64_t, dp::Error> getEntryCount();
        dp::Result<int64_t, dp::Error> getTransactionCount();
        dp::Result<int64_t, dp::Error> getWalletCount();

        /// Run SQLite integrity check
        bool quickCheck();

      private:
        friend class UnitOfWork;

        /// Borrow a pooled connection, waiting until `deadline` at most
        dp::Result<sqlite3 *, dp::Error> acquireConnection(std::chrono::steady_clock::time_point deadline);
        void releaseConnection(sqlite3 *db);

        dp::Result<sqlite3 *, dp::Error> openConnection();
        void applyPragmas(sqlite3 *db);
        dp::Result<int64_t, dp::Error> countRows(const char *table);
        dp::Result<void, dp::Error> createSchemaV1(Connection &conn);

        std::string path_;
        OpenOptions opts_;
        std::atomic<bool> is_open_;

        std::mutex pool_mutex_;
        std::condition_variable pool_cv_;
        std::vector<sqlite3 *> connections_;
        std::vector<sqlite3 *> idle_;

        KeyedLockTable locks_;

        // Core schema SQL definitions (inline, no separate files)
        static constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *ASSET_TYPES_TABLE = R"(
            CREATE TABLE IF NOT EXISTS asset_types (
                id TEXT PRIMARY KEY,
                name TEXT NOT NULL UNIQUE,
                symbol TEXT NOT NULL UNIQUE,
                description TEXT,
                created_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *USERS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS users (
                id TEXT PRIMARY KEY,
                username TEXT NOT NULL UNIQUE,
                email TEXT NOT NULL UNIQUE,
                is_system INTEGER NOT NULL DEFAULT 0 CHECK (is_system IN (0, 1)),
                created_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *WALLETS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS wallets (
                id TEXT PRIMARY KEY,
                user_id TEXT NOT NULL,
                asset_type_id TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                UNIQUE(user_id, asset_type_id),
                FOREIGN KEY(user_id) REFERENCES users(id) ON DELETE RESTRICT,
                FOREIGN KEY(asset_type_id) REFERENCES asset_types(id) ON DELETE RESTRICT
            )
        )";

        static constexpr const char *TRANSACTIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS transactions (
                id TEXT PRIMARY KEY,
                kind TEXT NOT NULL CHECK (kind IN ('TOPUP', 'BONUS', 'SPEND')),
                status TEXT NOT NULL DEFAULT 'PENDING' CHECK (status IN ('PENDING', 'COMPLETED', 'FAILED')),
                description TEXT,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            )
        )";

        static constexpr const char *LEDGER_ENTRIES_TABLE = R"(
            CREATE TABLE IF NOT EXISTS ledger_entries (
                sequence INTEGER PRIMARY KEY AUTOINCREMENT,
                id TEXT NOT NULL UNIQUE,
                transaction_id TEXT NOT NULL,
                asset_type_id TEXT NOT NULL,
                debit_wallet_id TEXT NOT NULL,
                credit_wallet_id TEXT NOT NULL,
                amount INTEGER NOT NULL CHECK (amount > 0),
                kind TEXT NOT NULL CHECK (kind IN ('TOPUP', 'BONUS', 'SPEND')),
                description TEXT,
                idempotency_key TEXT UNIQUE,
                metadata TEXT,
                resulting_balance INTEGER,
                prev_hash TEXT NOT NULL,
                entry_hash TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                CHECK (debit_wallet_id <> credit_wallet_id),
                FOREIGN KEY(transaction_id) REFERENCES transactions(id) ON DELETE RESTRICT,
                FOREIGN KEY(asset_type_id) REFERENCES asset_types(id) ON DELETE RESTRICT,
                FOREIGN KEY(debit_wallet_id) REFERENCES wallets(id) ON DELETE RESTRICT,
                FOREIGN KEY(credit_wallet_id) REFERENCES wallets(id) ON DELETE RESTRICT
            )
        )";

        static constexpr const char *IDX_USERS_SINGLE_SYSTEM =
            "CREATE UNIQUE INDEX IF NOT EXISTS idx_users_single_system ON users(is_system) WHERE is_system = 1";
        static constexpr const char *IDX_ENTRIES_DEBIT =
            "CREATE INDEX IF NOT EXISTS idx_entries_debit ON ledger_entries(debit_wallet_id)";
        static constexpr const char *IDX_ENTRIES_CREDIT =
            "CREATE INDEX IF NOT EXISTS idx_entries_credit ON ledger_entries(credit_wallet_id)";
        static constexpr const char *IDX_ENTRIES_TRANSACTION =
            "CREATE INDEX IF NOT EXISTS idx_entries_transaction ON ledger_entries(transaction_id)";
        static constexpr const char *IDX_ENTRIES_CREATED =
            "CREATE INDEX IF NOT EXISTS idx_entries_created ON ledger_entries(created_at)";
        static constexpr const char *IDX_ENTRIES_ASSET =
            "CREATE INDEX IF NOT EXISTS idx_entries_asset ON ledger_entries(asset_type_id)";

        // Append-only enforcement at the store level
        static constexpr const char *TRG_ENTRIES_NO_UPDATE = R"(
            CREATE TRIGGER IF NOT EXISTS trg_entries_no_update BEFORE UPDATE ON ledger_entries
            BEGIN
                SELECT RAISE(ABORT, 'ledger entries are immutable');
            END
        )";
        static constexpr const char *TRG_ENTRIES_NO_DELETE = R"(
            CREATE TRIGGER IF NOT EXISTS trg_entries_no_delete BEFORE DELETE ON ledger_entries
            BEGIN
                SELECT RAISE(ABORT, 'ledger entries are append-only');
            END
        )";
        static constexpr const char *TRG_TRANSACTIONS_NO_DELETE = R"(
            CREATE TRIGGER IF NOT EXISTS trg_transactions_no_delete BEFORE DELETE ON transactions
            BEGIN
                SELECT RAISE(ABORT, 'transactions are never deleted');
            END
        )";
    };

} // namespace coffer::storage
