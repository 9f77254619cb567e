#include <coffer/common/error.hpp>
#include <coffer/ledger/reference_data.hpp>
#include <coffer/ledger/seed.hpp>
#include <coffer/storage/unit_of_work.hpp>

#include <vector>

namespace coffer::ledger {

    namespace {

        dp::Result<AssetType, dp::Error> ensureAsset(storage::Connection &conn, const std::string &name,
                                                    const std::string &symbol, const std::string &description) {
            auto found = ReferenceData::findAssetTypeBySymbol(conn, symbol);
            if (!found.is_ok()) {
                return dp::Result<AssetType, dp::Error>::err(found.error());
            }
            if (found.value().has_value()) {
                return dp::Result<AssetType, dp::Error>::ok(*found.value());
            }
            return ReferenceData::createAssetType(conn, name, symbol, description);
        }

        dp::Result<User, dp::Error> ensureUser(storage::Connection &conn, const std::string &username,
                                              const std::string &email, bool is_system) {
            auto found = ReferenceData::findUserByUsername(conn, username);
            if (!found.is_ok()) {
                return dp::Result<User, dp::Error>::err(found.error());
            }
            if (found.value().has_value()) {
                return dp::Result<User, dp::Error>::ok(*found.value());
            }
            return ReferenceData::createUser(conn, username, email, is_system);
        }

        struct OpeningBalance {
            TransferKind kind;
            const User *user;
            const AssetType *asset;
            int64_t whole;
            std::string description;
        };

    } // namespace

    dp::Result<SeedResult, dp::Error> seedDefaults(storage::Database &db, TransactionCoordinator &coordinator) {
        SeedResult seeded;

        {
            auto unit = db.beginUnit(storage::UnitMode::Write, coordinator.config().unit_timeout);
            auto begun = unit->begin();
            if (!begun.is_ok()) {
                return dp::Result<SeedResult, dp::Error>::err(begun.error());
            }
            auto &conn = unit->connection();

            auto gc = ensureAsset(conn, "Gold Coins", "GC", "Premium in-game currency");
            if (!gc.is_ok())
                return dp::Result<SeedResult, dp::Error>::err(gc.error());
            auto dia = ensureAsset(conn, "Diamonds", "DIA", "Rare premium gems");
            if (!dia.is_ok())
                return dp::Result<SeedResult, dp::Error>::err(dia.error());
            auto lp = ensureAsset(conn, "Loyalty Points", "LP", "Reward points for activity");
            if (!lp.is_ok())
                return dp::Result<SeedResult, dp::Error>::err(lp.error());

            auto treasury = ensureUser(conn, "treasury", "treasury@system.internal", true);
            if (!treasury.is_ok())
                return dp::Result<SeedResult, dp::Error>::err(treasury.error());
            auto alice = ensureUser(conn, "alice", "alice@example.com", false);
            if (!alice.is_ok())
                return dp::Result<SeedResult, dp::Error>::err(alice.error());
            auto bob = ensureUser(conn, "bob", "bob@example.com", false);
            if (!bob.is_ok())
                return dp::Result<SeedResult, dp::Error>::err(bob.error());

            auto committed = unit->commit();
            if (!committed.is_ok()) {
                return dp::Result<SeedResult, dp::Error>::err(committed.error());
            }

            seeded.gold_coins = gc.value();
            seeded.diamonds = dia.value();
            seeded.loyalty_points = lp.value();
            seeded.treasury = treasury.value();
            seeded.alice = alice.value();
            seeded.bob = bob.value();
        }

        const std::vector<OpeningBalance> balances = {
            {TransferKind::TopUp, &seeded.alice, &seeded.gold_coins, 1000, "Alice's initial Gold Coins"},
            {TransferKind::TopUp, &seeded.alice, &seeded.diamonds, 50, "Alice's initial Diamonds"},
            {TransferKind::Bonus, &seeded.bob, &seeded.gold_coins, 500, "Bob's welcome bonus Gold Coins"},
            {TransferKind::Bonus, &seeded.bob, &seeded.loyalty_points, 200, "Bob's initial Loyalty Points"},
        };

        for (const auto &opening : balances) {
            TransferCommand cmd;
            cmd.user_id = opening.user->id;
            cmd.asset_type_id = opening.asset->id;
            cmd.amount = Amount::fromWhole(opening.whole);
            cmd.idempotency_key =
                "seed-" + opening.user->username + "-" + opening.asset->symbol + "-" + transferKindToString(opening.kind);
            cmd.description = opening.description;

            auto applied = coordinator.execute(opening.kind, cmd);
            if (!applied.is_ok()) {
                return dp::Result<SeedResult, dp::Error>::err(applied.error());
            }
        }

        return dp::Result<SeedResult, dp::Error>::ok(seeded);
    }

} // namespace coffer::ledger
