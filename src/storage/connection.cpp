#include <coffer/common/error.hpp>
#include <coffer/storage/connection.hpp>

#include <sqlite3.h>

namespace coffer::storage {

    // ===========================================
    // Statement
    // ===========================================

    Statement::Statement(sqlite3 *db, const std::string &sql) : stmt_(nullptr), prepare_rc_(SQLITE_MISUSE) {
        if (!db)
            return;

        prepare_rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
        if (prepare_rc_ != SQLITE_OK && stmt_) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    Statement::~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement::Statement(Statement &&other) noexcept : stmt_(other.stmt_), prepare_rc_(other.prepare_rc_) {
        other.stmt_ = nullptr;
    }

    Statement &Statement::operator=(Statement &&other) noexcept {
        if (this != &other) {
            if (stmt_) {
                sqlite3_finalize(stmt_);
            }
            stmt_ = other.stmt_;
            prepare_rc_ = other.prepare_rc_;
            other.stmt_ = nullptr;
        }
        return *this;
    }

    Statement &Statement::bind(int index, const std::string &value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
        return *this;
    }

    Statement &Statement::bind(int index, const char *value) {
        sqlite3_bind_text(stmt_, index, value, -1, SQLITE_TRANSIENT);
        return *this;
    }

    Statement &Statement::bind(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
        return *this;
    }

    Statement &Statement::bind(int index, const std::optional<std::string> &value) {
        if (value) {
            return bind(index, *value);
        }
        return bindNull(index);
    }

    Statement &Statement::bind(int index, const std::optional<int64_t> &value) {
        if (value) {
            return bind(index, *value);
        }
        return bindNull(index);
    }

    Statement &Statement::bindNull(int index) {
        sqlite3_bind_null(stmt_, index);
        return *this;
    }

    int Statement::step() {
        if (!stmt_)
            return prepare_rc_;
        return sqlite3_step(stmt_);
    }

    bool Statement::isNull(int column) const { return sqlite3_column_type(stmt_, column) == SQLITE_NULL; }

    std::string Statement::text(int column) const {
        const unsigned char *value = sqlite3_column_text(stmt_, column);
        return value ? reinterpret_cast<const char *>(value) : "";
    }

    std::optional<std::string> Statement::optionalText(int column) const {
        if (isNull(column))
            return std::nullopt;
        return text(column);
    }

    int64_t Statement::int64(int column) const { return sqlite3_column_int64(stmt_, column); }

    std::optional<int64_t> Statement::optionalInt64(int column) const {
        if (isNull(column))
            return std::nullopt;
        return int64(column);
    }

    // ===========================================
    // Connection
    // ===========================================

    dp::Result<void, dp::Error> Connection::execute(const std::string &sql) {
        if (!db_)
            return dp::Result<void, dp::Error>::err(internal_error("Connection is not open"));

        char *errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);

        if (rc != SQLITE_OK) {
            if (errmsg) {
                sqlite3_free(errmsg);
            }
            return dp::Result<void, dp::Error>::err(errorFor(rc, "exec"));
        }

        return dp::Result<void, dp::Error>::ok();
    }

    Statement Connection::prepare(const std::string &sql) { return Statement(db_, sql); }

    int64_t Connection::changes() const { return db_ ? sqlite3_changes(db_) : 0; }

    int64_t Connection::lastInsertRowId() const { return db_ ? sqlite3_last_insert_rowid(db_) : 0; }

    dp::Error Connection::errorFor(int rc, const std::string &context) const {
        std::string msg = context + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));

        switch (rc) {
        case SQLITE_CONSTRAINT_UNIQUE:
        case SQLITE_CONSTRAINT_PRIMARYKEY:
            return conflict(msg);
        case SQLITE_CONSTRAINT_CHECK:
        case SQLITE_CONSTRAINT_TRIGGER:
        case SQLITE_CONSTRAINT_NOTNULL:
            return validation_error(msg);
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            return not_found(msg);
        default:
            break;
        }

        switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return timeout(msg);
        default:
            return internal_error(msg);
        }
    }

} // namespace coffer::storage
