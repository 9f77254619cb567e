#include <coffer/common/error.hpp>
#include <coffer/common/ids.hpp>
#include <coffer/storage/database.hpp>
#include <coffer/storage/unit_of_work.hpp>

#include <sqlite3.h>

namespace coffer::storage {

    namespace {
        // Schema changes are small; generous fixed bound
        constexpr std::chrono::milliseconds kAdminTimeout{30000};
    } // namespace

    Database::Database() : is_open_(false) {}

    Database::~Database() { close(); }

    dp::Result<void, dp::Error> Database::open(const std::string &path, const OpenOptions &opts) {
        if (is_open_) {
            return dp::Result<void, dp::Error>::err(internal_error("Database already open: " + path_));
        }

        path_ = path;
        opts_ = opts;
        if (path_ == ":memory:" || opts_.pool_size < 1) {
            // every in-memory connection would be a separate database
            opts_.pool_size = 1;
        }

        for (int32_t i = 0; i < opts_.pool_size; ++i) {
            auto conn = openConnection();
            if (!conn.is_ok()) {
                for (auto *db : connections_) {
                    sqlite3_close_v2(db);
                }
                connections_.clear();
                return dp::Result<void, dp::Error>::err(conn.error());
            }
            connections_.push_back(conn.value());
        }

        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            idle_ = connections_;
            is_open_ = true;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    void Database::close() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (auto *db : connections_) {
            sqlite3_close_v2(db);
        }
        connections_.clear();
        idle_.clear();
        is_open_ = false;
        pool_cv_.notify_all();
    }

    bool Database::isOpen() const { return is_open_; }

    dp::Result<sqlite3 *, dp::Error> Database::openConnection() {
        sqlite3 *db = nullptr;
        int rc = sqlite3_open_v2(path_.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            if (db) {
                sqlite3_close(db);
            }
            return dp::Result<sqlite3 *, dp::Error>::err(internal_error("Cannot open " + path_ + ": " + msg));
        }

        sqlite3_extended_result_codes(db, 1);
        applyPragmas(db);
        return dp::Result<sqlite3 *, dp::Error>::ok(db);
    }

    void Database::applyPragmas(sqlite3 *db) {
        if (opts_.enable_wal) {
            sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        if (opts_.enable_foreign_keys) {
            sqlite3_exec(db, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        }

        sqlite3_busy_timeout(db, opts_.busy_timeout_ms);

        std::string cache_size = "PRAGMA cache_size=-" + std::to_string(opts_.cache_size_kb) + ";";
        sqlite3_exec(db, cache_size.c_str(), nullptr, nullptr, nullptr);

        std::string sync_mode;
        switch (opts_.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sync_mode = "PRAGMA synchronous=OFF;";
            break;
        case OpenOptions::Synchronous::NORMAL:
            sync_mode = "PRAGMA synchronous=NORMAL;";
            break;
        case OpenOptions::Synchronous::FULL:
            sync_mode = "PRAGMA synchronous=FULL;";
            break;
        }
        sqlite3_exec(db, sync_mode.c_str(), nullptr, nullptr, nullptr);
    }

    // ===========================================
    // Connection pool
    // ===========================================

    dp::Result<sqlite3 *, dp::Error> Database::acquireConnection(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(pool_mutex_);
        bool ready = pool_cv_.wait_until(lock, deadline, [this] { return !is_open_ || !idle_.empty(); });

        if (!is_open_) {
            return dp::Result<sqlite3 *, dp::Error>::err(internal_error("Database is not open"));
        }
        if (!ready) {
            return dp::Result<sqlite3 *, dp::Error>::err(timeout("Timed out waiting for a database connection"));
        }

        sqlite3 *db = idle_.back();
        idle_.pop_back();
        return dp::Result<sqlite3 *, dp::Error>::ok(db);
    }

    void Database::releaseConnection(sqlite3 *db) {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!is_open_)
                return;
            idle_.push_back(db);
        }
        pool_cv_.notify_one();
    }

    std::unique_ptr<UnitOfWork> Database::beginUnit(UnitMode mode, std::chrono::milliseconds timeout) {
        return std::make_unique<UnitOfWork>(*this, mode, timeout);
    }

    // ===========================================
    // Schema
    // ===========================================

    dp::Result<void, dp::Error> Database::initializeSchema() {
        auto unit = beginUnit(UnitMode::Write, kAdminTimeout);
        auto begun = unit->begin();
        if (!begun.is_ok())
            return begun;

        Connection &conn = unit->connection();

        // Create schema migrations table first
        auto migrations = conn.execute(SCHEMA_MIGRATIONS_TABLE);
        if (!migrations.is_ok())
            return migrations;

        auto version_stmt = conn.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations");
        if (!version_stmt.ok()) {
            return dp::Result<void, dp::Error>::err(conn.errorFor(version_stmt.prepareCode(), "schema version"));
        }
        int64_t current_version = 0;
        if (version_stmt.step() == SQLITE_ROW) {
            current_version = version_stmt.int64(0);
        }

        // Apply migrations if needed
        if (current_version < 1) {
            auto created = createSchemaV1(conn);
            if (!created.is_ok())
                return created;

            auto record = conn.prepare("INSERT INTO schema_migrations (version, applied_at) VALUES (?, ?)");
            record.bind(1, int64_t{1}).bind(2, currentTimestampMs());
            int rc = record.step();
            if (rc != SQLITE_DONE) {
                return dp::Result<void, dp::Error>::err(conn.errorFor(rc, "record schema version"));
            }
        }

        return unit->commit();
    }

    dp::Result<void, dp::Error> Database::createSchemaV1(Connection &conn) {
        const char *statements[] = {ASSET_TYPES_TABLE,       USERS_TABLE,           WALLETS_TABLE,
                                    TRANSACTIONS_TABLE,      LEDGER_ENTRIES_TABLE,  IDX_USERS_SINGLE_SYSTEM,
                                    IDX_ENTRIES_DEBIT,       IDX_ENTRIES_CREDIT,    IDX_ENTRIES_TRANSACTION,
                                    IDX_ENTRIES_CREATED,     IDX_ENTRIES_ASSET,     TRG_ENTRIES_NO_UPDATE,
                                    TRG_ENTRIES_NO_DELETE,   TRG_TRANSACTIONS_NO_DELETE};
        for (const char *sql : statements) {
            auto result = conn.execute(sql);
            if (!result.is_ok())
                return result;
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<int32_t, dp::Error> Database::schemaVersion() {
        auto unit = beginUnit(UnitMode::Read, kAdminTimeout);
        auto begun = unit->begin();
        if (!begun.is_ok())
            return dp::Result<int32_t, dp::Error>::err(begun.error());

        Connection &conn = unit->connection();
        auto exists = conn.prepare("SELECT name FROM sqlite_master WHERE type='table' AND name='schema_migrations'");
        if (exists.step() != SQLITE_ROW) {
            return dp::Result<int32_t, dp::Error>::ok(0);
        }

        auto stmt = conn.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations");
        int rc = stmt.step();
        if (rc != SQLITE_ROW) {
            return dp::Result<int32_t, dp::Error>::err(conn.errorFor(rc, "schema version"));
        }
        return dp::Result<int32_t, dp::Error>::ok(static_cast<int32_t>(stmt.int64(0)));
    }

    // ===========================================
    // Statistics
    // ===========================================

    dp::Result<int64_t, dp::Error> Database::countRows(const char *table) {
        auto unit = beginUnit(UnitMode::Read, kAdminTimeout);
        auto begun = unit->begin();
        if (!begun.is_ok())
            return dp::Result<int64_t, dp::Error>::err(begun.error());

        Connection &conn = unit->connection();
        auto stmt = conn.prepare(std::string("SELECT COUNT(*) FROM ") + table);
        int rc = stmt.step();
        if (rc != SQLITE_ROW) {
            return dp::Result<int64_t, dp::Error>::err(conn.errorFor(rc, std::string("count ") + table));
        }
        return dp::Result<int64_t, dp::Error>::ok(stmt.int64(0));
    }

    dp::Result<int64_t, dp::Error> Database::getEntryCount() { return countRows("ledger_entries"); }

    dp::Result<int64_t, dp::Error> Database::getTransactionCount() { return countRows("transactions"); }

    dp::Result<int64_t, dp::Error> Database::getWalletCount() { return countRows("wallets"); }

    bool Database::quickCheck() {
        auto unit = beginUnit(UnitMode::Read, kAdminTimeout);
        if (!unit->begin().is_ok())
            return false;

        auto stmt = unit->connection().prepare("PRAGMA quick_check");
        bool ok = false;
        if (stmt.step() == SQLITE_ROW) {
            ok = (stmt.text(0) == "ok");
        }
        return ok;
    }

} // namespace coffer::storage
