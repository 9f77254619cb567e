#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <coffer/common/error.hpp>
#include <coffer/ledger/audit_chain.hpp>
#include <coffer/ledger/journal.hpp>
#include <coffer/ledger/ledger_queries.hpp>

#include <atomic>
#include <random>
#include <thread>
#include <vector>

using namespace coffer;
using namespace coffer::ledger;
using coffer::storage::UnitMode;

TEST_SUITE("Ledger Scenario Tests") {
    TEST_CASE("Top-up then replay") {
        TestDB t("test_scn_topup");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);
        LedgerQueries queries(t.db);

        auto cmd = makeCommand(f.alice.id, f.gold.id, 500, "scn-topup-1");
        auto first = coordinator.topUp(cmd);
        REQUIRE(first.is_ok());
        CHECK_FALSE(first.value().replay);
        CHECK(queries.getBalance(f.alice.id, f.gold.id).value().balanceString() == "500.0000");

        auto second = coordinator.topUp(cmd);
        REQUIRE(second.is_ok());
        CHECK(second.value().replay);
        CHECK(second.value().transaction_id == first.value().transaction_id);
        CHECK(queries.getBalance(f.alice.id, f.gold.id).value().balanceString() == "500.0000");
        CHECK(t.db.getEntryCount().value() == 1);
    }

    TEST_CASE("Overspend is rejected without side effects") {
        TestDB t("test_scn_overspend");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);
        LedgerQueries queries(t.db);
        REQUIRE(coordinator.topUp(makeCommand(f.alice.id, f.gold.id, 50, "scn-fund")).is_ok());

        auto r = coordinator.spend(makeCommand(f.alice.id, f.gold.id, 9999, "scn-overspend"));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ERR_INSUFFICIENT_FUNDS);
        CHECK(errorMessage(r.error()).find("Available: 50.0000") != std::string::npos);
        CHECK(errorMessage(r.error()).find("Required: 9999") != std::string::npos);

        CHECK(queries.getBalance(f.alice.id, f.gold.id).value().balanceString() == "50.0000");
        CHECK(t.db.getEntryCount().value() == 1);
        CHECK(t.db.getTransactionCount().value() == 1);
    }

    TEST_CASE("Concurrent spends never overdraw") {
        TestDB t("test_scn_concurrent");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);
        LedgerQueries queries(t.db);
        REQUIRE(coordinator.topUp(makeCommand(f.alice.id, f.gold.id, 50, "scn-conc-fund")).is_ok());

        constexpr int kSpenders = 10;
        std::atomic<int> succeeded{0};
        std::atomic<int> insufficient{0};
        std::atomic<int> other{0};

        std::vector<std::thread> threads;
        for (int i = 0; i < kSpenders; ++i) {
            threads.emplace_back([&, i] {
                auto r = coordinator.spend(makeCommand(f.alice.id, f.gold.id, 10, "scn-conc-" + std::to_string(i)));
                if (r.is_ok()) {
                    succeeded++;
                } else if (r.error().code == ERR_INSUFFICIENT_FUNDS) {
                    insufficient++;
                } else {
                    other++;
                }
            });
        }
        for (auto &th : threads) {
            th.join();
        }

        CHECK(succeeded.load() == 5);
        CHECK(insufficient.load() == 5);
        CHECK(other.load() == 0);
        CHECK(queries.getBalance(f.alice.id, f.gold.id).value().balanceString() == "0.0000");
    }

    TEST_CASE("Bonus with a caller description") {
        TestDB t("test_scn_bonus");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);
        LedgerQueries queries(t.db);

        auto cmd = makeCommand(f.bob.id, f.points.id, 100, "scn-referral");
        cmd.description = "referral";
        REQUIRE(coordinator.bonus(cmd).is_ok());

        auto balance = queries.getBalance(f.bob.id, f.points.id);
        REQUIRE(balance.is_ok());
        CHECK(balance.value().balanceString() == "100.0000");
        CHECK(balance.value().asset_symbol == "LP");

        auto history = queries.getHistory(f.bob.id);
        REQUIRE(history.is_ok());
        REQUIRE(history.value().size() == 1);
        CHECK(history.value()[0].kind == TransferKind::Bonus);
        CHECK(history.value()[0].description.value_or("") == "referral");
        CHECK(history.value()[0].status == TxStatus::Completed);
    }

    TEST_CASE("Balance of an untouched pair") {
        TestDB t("test_scn_untouched");
        auto f = makeFixture(t.db);
        LedgerQueries queries(t.db);

        auto balance = queries.getBalance(f.alice.id, f.points.id);
        REQUIRE(balance.is_ok());
        CHECK(balance.value().balanceString() == "0.0000");
        CHECK(balance.value().asset_name == "Loyalty Points");
        CHECK(t.db.getWalletCount().value() == 0);
    }

    TEST_CASE("Random workload keeps the ledger consistent") {
        TestDB t("test_scn_properties");
        auto f = makeFixture(t.db);
        TransactionCoordinator coordinator(t.db);
        LedgerQueries queries(t.db);

        const std::vector<std::string> users = {f.alice.id, f.bob.id};
        const std::vector<std::string> assets = {f.gold.id, f.points.id};
        constexpr int kThreads = 4;
        constexpr int kOpsPerThread = 40;
        std::atomic<int> unexpected{0};

        std::vector<std::thread> threads;
        for (int w = 0; w < kThreads; ++w) {
            threads.emplace_back([&, w] {
                std::mt19937 rng(static_cast<unsigned>(1234 + w));
                for (int i = 0; i < kOpsPerThread; ++i) {
                    auto cmd = makeCommand(users[rng() % users.size()], assets[rng() % assets.size()],
                                           1 + static_cast<int64_t>(rng() % 20),
                                           "prop-" + std::to_string(w) + "-" + std::to_string(i));
                    // every fifth request reuses an earlier key
                    if (i > 0 && i % 5 == 0) {
                        cmd.idempotency_key = "prop-" + std::to_string(w) + "-" + std::to_string(i - 1);
                    }
                    int pick = static_cast<int>(rng() % 3);
                    auto kind = pick == 0 ? TransferKind::TopUp : (pick == 1 ? TransferKind::Bonus : TransferKind::Spend);
                    auto r = coordinator.execute(kind, cmd);
                    if (r.is_err() && r.error().code != ERR_INSUFFICIENT_FUNDS) {
                        unexpected++;
                    }
                }
            });
        }
        for (auto &th : threads) {
            th.join();
        }

        CHECK(unexpected.load() == 0);

        // no user wallet is ever negative
        for (const auto &user : users) {
            for (const auto &asset : assets) {
                auto balance = queries.getBalance(user, asset);
                REQUIRE(balance.is_ok());
                CHECK_FALSE(balance.value().balance.isNegative());
            }
        }

        // every asset sums to zero across all wallets, the treasury included
        auto balanced = queries.verifyZeroSum();
        CHECK(balanced.is_ok());

        auto unit = t.db.beginUnit(UnitMode::Read, std::chrono::milliseconds(5000));
        REQUIRE(unit->begin().is_ok());
        auto totals = AuditChain::zeroSumTotals(unit->connection());
        REQUIRE(totals.is_ok());
        for (const auto &row : totals.value()) {
            CHECK(row.balanced());
        }

        auto report = AuditChain::verify(unit->connection());
        REQUIRE(report.is_ok());
        CHECK(report.value().intact);
        CHECK(report.value().entries_checked == t.db.getEntryCount().value());
    }
}
