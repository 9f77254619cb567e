#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace coffer::storage {

    /// Exclusive locks on logical resources identified by string keys.
    /// Stands in for row-level locks, which SQLite does not offer.
    /// Entries are never evicted: keys are wallet ids and wallets are never deleted.
    class KeyedLockTable {
      public:
        /// One held lock. Declaration order matters: the unique_lock must be
        /// destroyed before the shared_ptr that keeps the mutex alive.
        struct HeldLock {
            std::string key;
            std::shared_ptr<std::timed_mutex> mutex;
            std::unique_lock<std::timed_mutex> lock;
        };

        KeyedLockTable() = default;

        KeyedLockTable(const KeyedLockTable &) = delete;
        KeyedLockTable &operator=(const KeyedLockTable &) = delete;

        /// Block until the lock on `key` is acquired or `deadline` passes.
        /// On success `out` owns the lock; on timeout `out` is left untouched.
        inline bool acquireUntil(const std::string &key, std::chrono::steady_clock::time_point deadline,
                                 HeldLock &out) {
            auto mutex = mutexFor(key);
            std::unique_lock<std::timed_mutex> lock(*mutex, std::defer_lock);
            if (!lock.try_lock_until(deadline)) {
                return false;
            }
            out.key = key;
            out.mutex = std::move(mutex);
            out.lock = std::move(lock);
            return true;
        }

        inline size_t size() const {
            std::lock_guard<std::mutex> guard(table_mutex_);
            return table_.size();
        }

      private:
        inline std::shared_ptr<std::timed_mutex> mutexFor(const std::string &key) {
            std::lock_guard<std::mutex> guard(table_mutex_);
            auto &slot = table_[key];
            if (!slot) {
                slot = std::make_shared<std::timed_mutex>();
            }
            return slot;
        }

        mutable std::mutex table_mutex_;
        std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> table_;
    };

} // namespace coffer::storage
