#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <coffer/common/error.hpp>
#include <coffer/ledger/idempotency_guard.hpp>
#include <coffer/ledger/journal.hpp>
#include <coffer/ledger/wallet_registry.hpp>

#include <atomic>
#include <set>
#include <sqlite3.h>
#include <thread>
#include <vector>

using namespace coffer;
using namespace coffer::ledger;
using coffer::storage::UnitMode;

TEST_SUITE("Idempotency Tests") {
    TEST_CASE("Replay lookup") {
        TestDB t("test_idem_lookup");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);
        IdempotencyGuard guard;

        auto topped = coordinator.topUp(makeCommand(f.alice.id, f.gold.id, 100, "idem-topup"));
        REQUIRE(topped.is_ok());
        auto spent = coordinator.spend(makeCommand(f.alice.id, f.gold.id, 30, "idem-spend"));
        REQUIRE(spent.is_ok());

        auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(5000));
        REQUIRE(unit->begin().is_ok());

        SUBCASE("Unknown key") {
            auto hit = guard.checkReplay(unit->connection(), "never-used");
            REQUIRE(hit.is_ok());
            CHECK_FALSE(hit.value().has_value());
        }

        SUBCASE("Committed top-up") {
            auto hit = guard.checkReplay(unit->connection(), "idem-topup");
            REQUIRE(hit.is_ok());
            REQUIRE(hit.value().has_value());
            CHECK(hit.value()->replay);
            CHECK(hit.value()->transaction_id == topped.value().transaction_id);
            CHECK(hit.value()->entry_id == topped.value().entry_id);
            CHECK(hit.value()->kind == TransferKind::TopUp);
            CHECK(hit.value()->amount == Amount::fromWhole(100));
            CHECK_FALSE(hit.value()->remaining_balance.has_value());
        }

        SUBCASE("Committed spend keeps its remaining balance") {
            auto hit = guard.checkReplay(unit->connection(), "idem-spend");
            REQUIRE(hit.is_ok());
            REQUIRE(hit.value().has_value());
            REQUIRE(hit.value()->remaining_balance.has_value());
            CHECK(hit.value()->remaining_balance->toString() == "70.0000");
        }
    }

    TEST_CASE("Repeated submissions create one entry") {
        TestDB t("test_idem_repeat");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);

        auto cmd = makeCommand(f.alice.id, f.gold.id, 40, "idem-repeat");
        auto first = coordinator.bonus(cmd);
        REQUIRE(first.is_ok());
        CHECK_FALSE(first.value().replay);

        for (int i = 0; i < 5; ++i) {
            auto again = coordinator.bonus(cmd);
            REQUIRE(again.is_ok());
            CHECK(again.value().replay);
            CHECK(again.value().transaction_id == first.value().transaction_id);
        }

        CHECK(t.db.getEntryCount().value() == 1);
        CHECK(t.db.getTransactionCount().value() == 1);
    }

    TEST_CASE("Same key with a different payload replays the original") {
        TestDB t("test_idem_payload");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);

        auto first = coordinator.topUp(makeCommand(f.alice.id, f.gold.id, 10, "idem-payload"));
        REQUIRE(first.is_ok());
        auto second = coordinator.topUp(makeCommand(f.alice.id, f.gold.id, 999, "idem-payload"));
        REQUIRE(second.is_ok());
        CHECK(second.value().replay);
        CHECK(second.value().amount == Amount::fromWhole(10));
    }

    TEST_CASE("Concurrent same-key requests commit once") {
        TestDB t("test_idem_race");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);
        constexpr int kThreads = 6;

        SUBCASE("Top-up") {
            std::vector<TransferResult> results(kThreads);
            std::atomic<int> failures{0};
            std::vector<std::thread> threads;
            for (int i = 0; i < kThreads; ++i) {
                threads.emplace_back([&, i] {
                    auto r = coordinator.topUp(makeCommand(f.alice.id, f.gold.id, 25, "race-topup"));
                    if (r.is_ok()) {
                        results[i] = r.value();
                    } else {
                        failures++;
                    }
                });
            }
            for (auto &th : threads) {
                th.join();
            }

            CHECK(failures.load() == 0);
            std::set<std::string> txn_ids;
            int fresh = 0;
            for (const auto &r : results) {
                txn_ids.insert(r.transaction_id);
                if (!r.replay)
                    fresh++;
            }
            CHECK(txn_ids.size() == 1);
            CHECK(fresh == 1);
            CHECK(t.db.getEntryCount().value() == 1);
            CHECK(t.db.getTransactionCount().value() == 1);
        }

        SUBCASE("Spend that exhausts the balance") {
            REQUIRE(coordinator.topUp(makeCommand(f.bob.id, f.gold.id, 10, "race-fund")).is_ok());

            std::vector<TransferResult> results(kThreads);
            std::atomic<int> failures{0};
            std::vector<std::thread> threads;
            for (int i = 0; i < kThreads; ++i) {
                threads.emplace_back([&, i] {
                    auto r = coordinator.spend(makeCommand(f.bob.id, f.gold.id, 10, "race-spend"));
                    if (r.is_ok()) {
                        results[i] = r.value();
                    } else {
                        failures++;
                    }
                });
            }
            for (auto &th : threads) {
                th.join();
            }

            // losers see the spent balance but still get the winner's result
            CHECK(failures.load() == 0);
            int fresh = 0;
            for (const auto &r : results) {
                CHECK(r.transaction_id == results[0].transaction_id);
                REQUIRE(r.remaining_balance.has_value());
                CHECK(r.remaining_balance->isZero());
                if (!r.replay)
                    fresh++;
            }
            CHECK(fresh == 1);
            CHECK(t.db.getEntryCount().value() == 2);
            CHECK(t.db.getTransactionCount().value() == 2);
        }
    }

    TEST_CASE("Duplicate key after the transaction row leaves nothing behind") {
        TestDB t("test_idem_orphan");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);
        REQUIRE(coordinator.topUp(makeCommand(f.alice.id, f.gold.id, 20, "idem-taken")).is_ok());

        {
            auto unit = t.db.beginUnit(UnitMode::Write, std::chrono::milliseconds(5000));
            REQUIRE(unit->begin().is_ok());
            auto &conn = unit->connection();

            WalletRegistry wallets;
            auto user_wallet = wallets.find(conn, f.alice.id, f.gold.id);
            auto treasury_wallet = wallets.find(conn, f.treasury.id, f.gold.id);
            REQUIRE(user_wallet.is_ok());
            REQUIRE(treasury_wallet.is_ok());
            REQUIRE(user_wallet.value().has_value());
            REQUIRE(treasury_wallet.value().has_value());

            auto txn = LedgerJournal::openTransaction(conn, TransferKind::TopUp, std::string("second attempt"));
            REQUIRE(txn.is_ok());

            LedgerEntry draft;
            draft.transaction_id = txn.value().id;
            draft.asset_type_id = f.gold.id;
            draft.debit_wallet_id = treasury_wallet.value()->id;
            draft.credit_wallet_id = user_wallet.value()->id;
            draft.amount = Amount::fromWhole(20);
            draft.kind = TransferKind::TopUp;
            draft.idempotency_key = std::string("idem-taken");

            auto appended = LedgerJournal::appendEntry(conn, draft);
            REQUIRE(appended.is_err());
            CHECK(appended.error().code == ERR_CONFLICT);
            // unit dropped without commit
        }

        CHECK(t.db.getTransactionCount().value() == 1);
        CHECK(t.db.getEntryCount().value() == 1);

        auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(5000));
        REQUIRE(unit->begin().is_ok());
        auto pending = unit->connection().prepare("SELECT COUNT(*) FROM transactions WHERE status <> 'COMPLETED'");
        REQUIRE(pending.step() == SQLITE_ROW);
        CHECK(pending.int64(0) == 0);
    }
}
