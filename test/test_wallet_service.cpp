#include <doctest/doctest.h>

#include "test_helpers.hpp"

#include <coffer/api/wallet_service.hpp>
#include <coffer/common/error.hpp>
#include <coffer/common/ids.hpp>

using namespace coffer;
using namespace coffer::api;

TEST_SUITE("Wallet Service Tests") {
    TEST_CASE("Seeding") {
        TestDB t("test_service_seed");
        WalletService service(t.db);

        auto seeded = service.seedDefaults();
        REQUIRE(seeded.is_ok());
        const auto &s = seeded.value();
        CHECK(s.gold_coins.symbol == "GC");
        CHECK(s.diamonds.symbol == "DIA");
        CHECK(s.loyalty_points.symbol == "LP");
        CHECK(s.treasury.is_system);
        CHECK_FALSE(s.alice.is_system);

        auto balance = [&](const ledger::User &user, const ledger::AssetType &asset) {
            auto view = service.getBalance({user.id, asset.id});
            REQUIRE(view.is_ok());
            return view.value().balanceString();
        };

        CHECK(balance(s.alice, s.gold_coins) == "1000.0000");
        CHECK(balance(s.alice, s.diamonds) == "50.0000");
        CHECK(balance(s.bob, s.gold_coins) == "500.0000");
        CHECK(balance(s.bob, s.loyalty_points) == "200.0000");
        CHECK(balance(s.bob, s.diamonds) == "0.0000");

        SUBCASE("Seeding again changes nothing") {
            auto again = service.seedDefaults();
            REQUIRE(again.is_ok());
            CHECK(again.value().alice.id == s.alice.id);
            CHECK(again.value().gold_coins.id == s.gold_coins.id);
            CHECK(t.db.getEntryCount().value() == 4);
            CHECK(balance(s.alice, s.gold_coins) == "1000.0000");
        }

        SUBCASE("Listings") {
            auto assets = service.listAssetTypes();
            REQUIRE(assets.is_ok());
            CHECK(assets.value().size() == 3);
            auto users = service.listUsers();
            REQUIRE(users.is_ok());
            CHECK(users.value().size() == 2);
        }

        SUBCASE("Integrity holds after seeding") {
            auto report = service.verifyIntegrity();
            REQUIRE(report.is_ok());
            CHECK(report.value().intact);
            CHECK(report.value().entries_checked == 4);
        }
    }

    TEST_CASE("Request flow") {
        TestDB t("test_service_flow");
        WalletService service(t.db);
        auto seeded = service.seedDefaults();
        REQUIRE(seeded.is_ok());
        const auto &s = seeded.value();

        TransferRequest request;
        request.user_id = s.alice.id;
        request.asset_type_id = s.gold_coins.id;
        request.amount = "250.25";
        request.idempotency_key = "svc-spend-1";

        SUBCASE("Spend then replay") {
            auto spent = service.spend(request);
            REQUIRE(spent.is_ok());
            REQUIRE(spent.value().remaining_balance.has_value());
            CHECK(spent.value().remaining_balance->toString() == "749.7500");

            auto replay = service.spend(request);
            REQUIRE(replay.is_ok());
            CHECK(replay.value().replay);
            CHECK(replay.value().remaining_balance->toString() == "749.7500");
        }

        SUBCASE("Top-up and bonus") {
            request.idempotency_key = "svc-topup-1";
            REQUIRE(service.topUp(request).is_ok());
            request.idempotency_key = "svc-bonus-1";
            REQUIRE(service.bonus(request).is_ok());
            CHECK(service.getBalance({s.alice.id, s.gold_coins.id}).value().balanceString() == "1500.5000");
        }

        SUBCASE("Malformed request never reaches the ledger") {
            request.amount = "-3";
            auto r = service.spend(request);
            REQUIRE(r.is_err());
            CHECK(r.error().code == ERR_VALIDATION);
            CHECK(t.db.getEntryCount().value() == 4);
        }

        SUBCASE("History through the service") {
            auto history = service.getHistory({s.bob.id, std::nullopt});
            REQUIRE(history.is_ok());
            CHECK(history.value().size() == 2);

            auto bad = service.getHistory({"not-a-uuid", std::nullopt});
            REQUIRE(bad.is_err());
            CHECK(bad.error().code == ERR_VALIDATION);
        }

        SUBCASE("Balance with an unknown asset") {
            auto r = service.getBalance({s.alice.id, generateId()});
            REQUIRE(r.is_err());
            CHECK(r.error().code == ERR_NOT_FOUND);
        }
    }
}
