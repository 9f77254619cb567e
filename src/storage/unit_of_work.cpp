#include <coffer/common/error.hpp>
#include <coffer/storage/unit_of_work.hpp>

#include <algorithm>
#include <cstdint>
#include <sqlite3.h>

namespace coffer::storage {

    UnitOfWork::UnitOfWork(Database &db, UnitMode mode, std::chrono::milliseconds timeout)
        : db_(db), mode_(mode), deadline_(std::chrono::steady_clock::now() + timeout), handle_(nullptr),
          active_(false) {}

    UnitOfWork::~UnitOfWork() { rollback(); }

    dp::Result<void, dp::Error> UnitOfWork::begin() {
        if (active_ || handle_) {
            return dp::Result<void, dp::Error>::err(internal_error("Unit of work already started"));
        }

        auto acquired = db_.acquireConnection(deadline_);
        if (!acquired.is_ok()) {
            return dp::Result<void, dp::Error>::err(acquired.error());
        }
        handle_ = acquired.value();
        conn_ = Connection(handle_);

        // SQLite's own busy wait must not outlive the unit
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - std::chrono::steady_clock::now());
        sqlite3_busy_timeout(handle_, static_cast<int>(std::clamp<int64_t>(remaining.count(), 1, INT32_MAX)));

        const char *sql = (mode_ == UnitMode::Write) ? "BEGIN IMMEDIATE" : "BEGIN DEFERRED";
        int rc = sqlite3_exec(handle_, sql, nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            auto error = conn_.errorFor(rc, "begin unit of work");
            finish();
            return dp::Result<void, dp::Error>::err(error);
        }

        active_ = true;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> UnitOfWork::commit() {
        if (!active_) {
            return dp::Result<void, dp::Error>::err(internal_error("Unit of work is not active"));
        }

        auto on_time = checkDeadline();
        if (!on_time.is_ok()) {
            rollback();
            return on_time;
        }

        int rc = sqlite3_exec(handle_, "COMMIT", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            auto error = conn_.errorFor(rc, "commit");
            rollback();
            return dp::Result<void, dp::Error>::err(error);
        }

        active_ = false;
        finish();
        return dp::Result<void, dp::Error>::ok();
    }

    void UnitOfWork::rollback() {
        if (active_) {
            // a failed COMMIT may already have ended the transaction
            if (!sqlite3_get_autocommit(handle_)) {
                sqlite3_exec(handle_, "ROLLBACK", nullptr, nullptr, nullptr);
            }
            active_ = false;
        }
        finish();
    }

    void UnitOfWork::finish() {
        // Locks go last: nobody may observe the wallets before our changes are final
        held_.clear();
        if (handle_) {
            sqlite3_busy_timeout(handle_, db_.opts_.busy_timeout_ms);
            db_.releaseConnection(handle_);
            handle_ = nullptr;
            conn_ = Connection();
        }
    }

    dp::Result<void, dp::Error> UnitOfWork::checkDeadline() const {
        if (std::chrono::steady_clock::now() > deadline_) {
            return dp::Result<void, dp::Error>::err(timeout("Unit of work exceeded its deadline"));
        }
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> UnitOfWork::lock(const std::string &key) {
        if (!active_) {
            return dp::Result<void, dp::Error>::err(internal_error("Cannot lock outside an active unit of work"));
        }
        if (holdsLock(key)) {
            return dp::Result<void, dp::Error>::ok();
        }

        KeyedLockTable::HeldLock held;
        if (!db_.locks().acquireUntil(key, deadline_, held)) {
            return dp::Result<void, dp::Error>::err(timeout("Timed out waiting for lock on " + key));
        }
        held_.push_back(std::move(held));
        return dp::Result<void, dp::Error>::ok();
    }

    bool UnitOfWork::holdsLock(const std::string &key) const {
        return std::any_of(held_.begin(), held_.end(), [&key](const KeyedLockTable::HeldLock &h) { return h.key == key; });
    }

    std::vector<std::string> UnitOfWork::heldLockKeys() const {
        std::vector<std::string> keys;
        keys.reserve(held_.size());
        for (const auto &h : held_) {
            keys.push_back(h.key);
        }
        return keys;
    }

} // namespace coffer::storage
