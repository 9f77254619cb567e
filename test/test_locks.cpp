#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <coffer/common/error.hpp>
#include <coffer/ledger/lock_coordinator.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace coffer;
using namespace coffer::storage;
using coffer::ledger::LockCoordinator;

TEST_SUITE("Lock Tests") {
    TEST_CASE("Keyed lock table") {
        KeyedLockTable table;
        auto far = std::chrono::steady_clock::now() + std::chrono::seconds(5);

        SUBCASE("Different keys do not block each other") {
            KeyedLockTable::HeldLock a;
            KeyedLockTable::HeldLock b;
            CHECK(table.acquireUntil("a", far, a));
            CHECK(table.acquireUntil("b", far, b));
            CHECK(table.size() == 2);
        }

        SUBCASE("Held key times out for a second owner") {
            KeyedLockTable::HeldLock first;
            REQUIRE(table.acquireUntil("w", far, first));

            bool second_got_it = true;
            std::thread other([&] {
                KeyedLockTable::HeldLock second;
                auto soon = std::chrono::steady_clock::now() + std::chrono::milliseconds(30);
                second_got_it = table.acquireUntil("w", soon, second);
            });
            other.join();
            CHECK_FALSE(second_got_it);
        }

        SUBCASE("Released key can be taken again") {
            {
                KeyedLockTable::HeldLock first;
                REQUIRE(table.acquireUntil("w", far, first));
            }
            bool got_it = false;
            std::thread other([&] {
                KeyedLockTable::HeldLock second;
                got_it = table.acquireUntil("w", std::chrono::steady_clock::now() + std::chrono::milliseconds(100),
                                            second);
            });
            other.join();
            CHECK(got_it);
        }
    }

    TEST_CASE("Lock order") {
        SUBCASE("Sorted and distinct") {
            auto order = LockCoordinator::lockOrder({"c", "a", "b", "a"});
            REQUIRE(order.size() == 3);
            CHECK(order[0] == "a");
            CHECK(order[1] == "b");
            CHECK(order[2] == "c");
        }

        SUBCASE("Input order does not matter") {
            CHECK(LockCoordinator::lockOrder({"w2", "w1"}) == LockCoordinator::lockOrder({"w1", "w2"}));
        }

        SUBCASE("Unit records locks in acquisition order") {
            TestDB t("test_lock_order");
            auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(2000));
            REQUIRE(unit->begin().is_ok());

            LockCoordinator locks;
            REQUIRE(locks.lockInOrder(*unit, {"zeta", "alpha", "mid"}).is_ok());
            auto held = unit->heldLockKeys();
            REQUIRE(held.size() == 3);
            CHECK(held[0] == "alpha");
            CHECK(held[1] == "mid");
            CHECK(held[2] == "zeta");

            // re-locking inside the same unit is a no-op
            REQUIRE(locks.lockInOrder(*unit, {"alpha"}).is_ok());
            CHECK(unit->heldLockCount() == 3);
        }
    }

    TEST_CASE("Lock wait honours the unit deadline") {
        TestDB t("test_lock_deadline");

        auto holder = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(5000));
        REQUIRE(holder->begin().is_ok());
        REQUIRE(holder->lock("wallet-x").is_ok());

        dp::u32 code = 0;
        std::thread waiter([&] {
            auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(50));
            if (unit->begin().is_err()) {
                return;
            }
            auto locked = unit->lock("wallet-x");
            if (locked.is_err()) {
                code = locked.error().code;
            }
        });
        waiter.join();
        CHECK(code == ERR_TIMEOUT);
    }

    TEST_CASE("Opposite lock orders never deadlock") {
        TestDB t("test_lock_stress");
        const std::vector<std::string> forward = {"wallet-1", "wallet-2"};
        const std::vector<std::string> backward = {"wallet-2", "wallet-1"};
        constexpr int kRounds = 200;

        std::atomic<int> completed{0};
        std::atomic<int> failures{0};

        auto worker = [&](const std::vector<std::string> &ids) {
            LockCoordinator locks;
            for (int i = 0; i < kRounds; ++i) {
                auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(5000));
                if (unit->begin().is_err() || locks.lockInOrder(*unit, ids).is_err()) {
                    failures++;
                    continue;
                }
                std::this_thread::yield();
                unit->rollback();
                completed++;
            }
        };

        std::thread a(worker, std::cref(forward));
        std::thread b(worker, std::cref(backward));
        std::thread c(worker, std::cref(forward));
        a.join();
        b.join();
        c.join();

        CHECK(failures.load() == 0);
        CHECK(completed.load() == 3 * kRounds);
    }
}
