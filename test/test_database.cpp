#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <coffer/common/error.hpp>
#include <coffer/ledger/journal.hpp>

#include <atomic>
#include <sqlite3.h>
#include <thread>

using namespace coffer;
using namespace coffer::storage;

TEST_SUITE("Database Tests") {
    TEST_CASE("Open and schema") {
        TestDB t("test_db_schema");

        SUBCASE("Schema version is recorded") {
            auto version = t.db.schemaVersion();
            REQUIRE(version.is_ok());
            CHECK(version.value() == 1);
        }

        SUBCASE("Initializing twice is harmless") {
            REQUIRE(t.db.initializeSchema().is_ok());
            auto version = t.db.schemaVersion();
            REQUIRE(version.is_ok());
            CHECK(version.value() == 1);
        }

        SUBCASE("Empty store counters") {
            CHECK(t.db.getEntryCount().value() == 0);
            CHECK(t.db.getTransactionCount().value() == 0);
            CHECK(t.db.getWalletCount().value() == 0);
            CHECK(t.db.quickCheck());
        }

        SUBCASE("Opening twice fails") {
            auto again = t.db.open(t.path);
            CHECK(again.is_err());
        }
    }

    TEST_CASE("In-memory database") {
        Database db;
        REQUIRE(db.open(":memory:").is_ok());
        REQUIRE(db.initializeSchema().is_ok());
        CHECK(db.isOpen());
        CHECK(db.schemaVersion().value() == 1);
        db.close();
        CHECK_FALSE(db.isOpen());
    }

    TEST_CASE("Open state is readable from another thread") {
        Database db;
        REQUIRE(db.open(":memory:").is_ok());

        std::atomic<bool> saw_open{false};
        std::thread watcher([&] {
            while (db.isOpen()) {
                saw_open = true;
                std::this_thread::yield();
            }
        });
        while (!saw_open) {
            std::this_thread::yield();
        }
        db.close();
        watcher.join();
        CHECK_FALSE(db.isOpen());
    }

    TEST_CASE("Unit of work commit and rollback") {
        TestDB t("test_db_units");

        SUBCASE("Committed rows are visible") {
            {
                auto unit = t.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(2000));
                REQUIRE(unit->begin().is_ok());
                REQUIRE(ledger::ReferenceData::createUser(unit->connection(), "carol", "carol@example.com").is_ok());
                REQUIRE(unit->commit().is_ok());
                CHECK_FALSE(unit->isActive());
            }
            auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(2000));
            REQUIRE(unit->begin().is_ok());
            auto found = ledger::ReferenceData::findUserByUsername(unit->connection(), "carol");
            REQUIRE(found.is_ok());
            CHECK(found.value().has_value());
        }

        SUBCASE("Destroying an uncommitted unit rolls back") {
            {
                auto unit = t.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(2000));
                REQUIRE(unit->begin().is_ok());
                REQUIRE(ledger::ReferenceData::createUser(unit->connection(), "dave", "dave@example.com").is_ok());
            }
            auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(2000));
            REQUIRE(unit->begin().is_ok());
            auto found = ledger::ReferenceData::findUserByUsername(unit->connection(), "dave");
            REQUIRE(found.is_ok());
            CHECK_FALSE(found.value().has_value());
        }

        SUBCASE("Explicit rollback releases locks") {
            auto unit = t.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(2000));
            REQUIRE(unit->begin().is_ok());
            REQUIRE(unit->lock("wallet-a").is_ok());
            CHECK(unit->holdsLock("wallet-a"));
            unit->rollback();
            CHECK(unit->heldLockCount() == 0);
            CHECK_FALSE(unit->isActive());
        }

        SUBCASE("Commit after deadline times out") {
            auto unit = t.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(1));
            REQUIRE(unit->begin().is_ok());
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            auto committed = unit->commit();
            REQUIRE(committed.is_err());
            CHECK(committed.error().code == ERR_TIMEOUT);
            CHECK_FALSE(unit->isActive());
        }

        SUBCASE("Lock outside an active unit is refused") {
            auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(2000));
            auto locked = unit->lock("wallet-a");
            CHECK(locked.is_err());
        }

        SUBCASE("Begin twice is refused") {
            auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(2000));
            REQUIRE(unit->begin().is_ok());
            CHECK(unit->begin().is_err());
        }
    }

    TEST_CASE("Connection pool exhaustion times out") {
        OpenOptions opts;
        opts.pool_size = 1;
        TestDB t("test_db_pool", opts);

        auto holder = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(2000));
        REQUIRE(holder->begin().is_ok());

        auto waiter = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(50));
        auto begun = waiter->begin();
        REQUIRE(begun.is_err());
        CHECK(begun.error().code == ERR_TIMEOUT);
    }

    TEST_CASE("Busy wait follows the unit deadline") {
        OpenOptions opts;
        opts.pool_size = 1;
        opts.busy_timeout_ms = 5000;
        TestDB t("test_db_busy", opts);

        auto busyTimeout = [](Connection &conn) {
            auto stmt = conn.prepare("PRAGMA busy_timeout");
            REQUIRE(stmt.step() == SQLITE_ROW);
            return stmt.int64(0);
        };

        {
            auto unit = t.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(20000));
            REQUIRE(unit->begin().is_ok());
            auto inside = busyTimeout(unit->connection());
            CHECK(inside > 5000);
            CHECK(inside <= 20000);
        }

        {
            auto unit = t.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(300));
            REQUIRE(unit->begin().is_ok());
            CHECK(busyTimeout(unit->connection()) <= 300);
        }

        SUBCASE("Second writer gives up at its own deadline") {
            OpenOptions shared;
            shared.pool_size = 2;
            TestDB two("test_db_busy_two", shared);

            auto writer = two.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(5000));
            REQUIRE(writer->begin().is_ok());

            auto started = std::chrono::steady_clock::now();
            auto late = two.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(200));
            auto begun = late->begin();
            auto waited = std::chrono::steady_clock::now() - started;

            REQUIRE(begun.is_err());
            CHECK(begun.error().code == ERR_TIMEOUT);
            CHECK(waited < std::chrono::milliseconds(3000));
        }
    }

    TEST_CASE("Store-level constraints") {
        TestDB t("test_db_constraints");
        auto f = makeFixture(t.db);
        ledger::TransactionCoordinator coordinator(t.db);
        REQUIRE(coordinator.topUp(makeCommand(f.alice.id, f.gold.id, 10, "constraint-seed")).is_ok());

        auto unit = t.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(2000));
        REQUIRE(unit->begin().is_ok());
        auto &conn = unit->connection();

        SUBCASE("Ledger entries reject UPDATE") {
            auto stmt = conn.prepare("UPDATE ledger_entries SET amount = 1");
            int rc = stmt.step();
            CHECK(rc != SQLITE_DONE);
            CHECK(conn.errorFor(rc, "update").code == ERR_VALIDATION);
        }

        SUBCASE("Ledger entries reject DELETE") {
            auto stmt = conn.prepare("DELETE FROM ledger_entries");
            CHECK(stmt.step() != SQLITE_DONE);
        }

        SUBCASE("Transactions reject DELETE") {
            auto stmt = conn.prepare("DELETE FROM transactions");
            CHECK(stmt.step() != SQLITE_DONE);
        }

        SUBCASE("Duplicate asset symbol is a conflict") {
            auto dup = ledger::ReferenceData::createAssetType(conn, "Other Gold", "GC");
            REQUIRE(dup.is_err());
            CHECK(dup.error().code == ERR_CONFLICT);
        }

        SUBCASE("Only one system user") {
            auto second = ledger::ReferenceData::createUser(conn, "treasury2", "t2@system.internal", true);
            REQUIRE(second.is_err());
            CHECK(second.error().code == ERR_CONFLICT);
        }

        SUBCASE("Duplicate idempotency key is a conflict") {
            auto existing = ledger::LedgerJournal::findEntryByKey(conn, "constraint-seed");
            REQUIRE(existing.is_ok());
            REQUIRE(existing.value().has_value());

            ledger::LedgerEntry draft = *existing.value();
            auto appended = ledger::LedgerJournal::appendEntry(conn, draft);
            REQUIRE(appended.is_err());
            CHECK(appended.error().code == ERR_CONFLICT);
        }
    }
}
