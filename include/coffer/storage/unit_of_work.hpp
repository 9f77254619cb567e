#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include "connection.hpp"
#include "database.hpp"
#include "keyed_lock_table.hpp"

namespace coffer::storage {

    // ===========================================
    // UnitOfWork - one atomic unit (RAII)
    // ===========================================

    /// Scoped SQLite transaction on a pooled connection, plus the resource locks
    /// taken inside it. Every exit path other than a successful commit() rolls
    /// back. Locks are released only after the SQLite transaction has ended.
    class UnitOfWork {
      public:
        UnitOfWork(Database &db, UnitMode mode, std::chrono::milliseconds timeout);
        ~UnitOfWork();

        UnitOfWork(const UnitOfWork &) = delete;
        UnitOfWork &operator=(const UnitOfWork &) = delete;

        /// Borrow a connection and open the SQLite transaction
        dp::Result<void, dp::Error> begin();

        /// Commit and release everything. On failure the unit is rolled back.
        dp::Result<void, dp::Error> commit();

        void rollback();

        bool isActive() const { return active_; }
        UnitMode mode() const { return mode_; }

        Connection &connection() { return conn_; }

        /// Timeout error once the deadline has passed
        dp::Result<void, dp::Error> checkDeadline() const;

        /// Exclusive lock on `key` until the unit ends. Re-locking a held key is a no-op.
        dp::Result<void, dp::Error> lock(const std::string &key);

        bool holdsLock(const std::string &key) const;
        size_t heldLockCount() const { return held_.size(); }

        /// Keys in acquisition order
        std::vector<std::string> heldLockKeys() const;

      private:
        void finish();

        Database &db_;
        UnitMode mode_;
        std::chrono::steady_clock::time_point deadline_;
        sqlite3 *handle_;
        Connection conn_;
        bool active_;
        std::vector<KeyedLockTable::HeldLock> held_;
    };

} // namespace coffer::storage
