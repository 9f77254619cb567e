#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>

// Forward declaration for sqlite3 C API
struct sqlite3;
struct sqlite3_stmt;

namespace coffer::storage {

    // ===========================================
    // Statement - prepared statement (RAII)
    // ===========================================

    class Statement {
      public:
        Statement(sqlite3 *db, const std::string &sql);
        ~Statement();

        // Non-copyable, movable
        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;
        Statement(Statement &&other) noexcept;
        Statement &operator=(Statement &&other) noexcept;

        /// False when preparation failed; prepareCode() has the SQLite result code
        bool ok() const { return stmt_ != nullptr; }
        int prepareCode() const { return prepare_rc_; }

        /// Bind helpers, 1-based parameter index
        Statement &bind(int index, const std::string &value);
        Statement &bind(int index, const char *value);
        Statement &bind(int index, int64_t value);
        Statement &bind(int index, const std::optional<std::string> &value);
        Statement &bind(int index, const std::optional<int64_t> &value);
        Statement &bindNull(int index);

        /// Advance the statement; returns the raw SQLite code (SQLITE_ROW, SQLITE_DONE, ...)
        int step();

        /// Column readers, 0-based column index
        bool isNull(int column) const;
        std::string text(int column) const;
        std::optional<std::string> optionalText(int column) const;
        int64_t int64(int column) const;
        std::optional<int64_t> optionalInt64(int column) const;

      private:
        sqlite3_stmt *stmt_;
        int prepare_rc_;
    };

    // ===========================================
    // Connection - non-owning view over a pooled sqlite3 handle
    // ===========================================

    class Connection {
      public:
        Connection() : db_(nullptr) {}
        explicit Connection(sqlite3 *db) : db_(db) {}

        bool valid() const { return db_ != nullptr; }
        sqlite3 *handle() const { return db_; }

        /// Execute one or more statements without parameters
        dp::Result<void, dp::Error> execute(const std::string &sql);

        /// Prepare a statement; check Statement::ok() before use
        Statement prepare(const std::string &sql);

        /// Rows changed by the last INSERT/UPDATE/DELETE
        int64_t changes() const;

        /// Rowid of the most recent successful INSERT
        int64_t lastInsertRowId() const;

        /// Translate a SQLite result code into a coffer error.
        /// Unique-key violations become Conflict, busy/locked become Timeout,
        /// CHECK and trigger violations become Validation, foreign keys NotFound.
        dp::Error errorFor(int rc, const std::string &context) const;

      private:
        sqlite3 *db_;
    };

} // namespace coffer::storage
