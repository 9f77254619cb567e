/**
 * Example: a complete wallet session against a fresh ledger file
 *
 * This demo shows how to:
 * 1. Open the store and create the schema
 * 2. Seed reference data and opening balances
 * 3. Top up, grant a bonus and spend, including an idempotent retry
 * 4. Read balances and history, then verify the audit chain
 */

#include <coffer.hpp>
#include <filesystem>
#include <iostream>

using namespace coffer;

static void printBalance(api::WalletService &service, const ledger::User &user, const ledger::AssetType &asset) {
    auto view = service.getBalance({user.id, asset.id});
    if (view.is_ok()) {
        std::cout << "   " << user.username << ": " << view.value().balanceString() << " " << view.value().asset_symbol
                  << std::endl;
    } else {
        std::cerr << "   balance failed: " << errorMessage(view.error()) << std::endl;
    }
}

int main() {
    const std::string path = "wallet_demo.db";
    for (const auto &suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path + suffix);
    }

    std::cout << "=== Coffer wallet demo ===" << std::endl;

    storage::Database db;
    auto opened = db.open(path);
    if (!opened.is_ok()) {
        std::cerr << "Failed to open database: " << errorMessage(opened.error()) << std::endl;
        return 1;
    }
    auto schema = db.initializeSchema();
    if (!schema.is_ok()) {
        std::cerr << "Failed to create schema: " << errorMessage(schema.error()) << std::endl;
        return 1;
    }

    LedgerConfig config;
    config.log_level = LogLevel::Info;
    api::WalletService service(db, config);

    // ===========================================
    // Step 1: Seed
    // ===========================================

    auto seeded = service.seedDefaults();
    if (!seeded.is_ok()) {
        std::cerr << "Seeding failed: " << errorMessage(seeded.error()) << std::endl;
        return 1;
    }
    const auto &s = seeded.value();

    std::cout << "\nOpening balances:" << std::endl;
    printBalance(service, s.alice, s.gold_coins);
    printBalance(service, s.alice, s.diamonds);
    printBalance(service, s.bob, s.gold_coins);
    printBalance(service, s.bob, s.loyalty_points);

    // ===========================================
    // Step 2: Transfers
    // ===========================================

    std::cout << "\nAlice tops up 500 GC" << std::endl;
    api::TransferRequest topup{s.alice.id, s.gold_coins.id, "500", "demo-topup-1", std::nullopt, std::nullopt};
    auto first = service.topUp(topup);
    auto retry = service.topUp(topup);
    if (first.is_ok() && retry.is_ok()) {
        std::cout << "   transaction " << first.value().transaction_id << std::endl;
        std::cout << "   retry replayed: " << (retry.value().replay ? "yes" : "no") << std::endl;
    }

    std::cout << "\nBob earns a referral bonus of 100 LP" << std::endl;
    api::TransferRequest referral{s.bob.id, s.loyalty_points.id, "100", "demo-bonus-1", std::string("referral"),
                                  std::string(R"({"referred":"carol"})")};
    auto bonus = service.bonus(referral);
    if (!bonus.is_ok()) {
        std::cerr << "   bonus failed: " << errorMessage(bonus.error()) << std::endl;
    }

    std::cout << "\nAlice buys an item for 249.99 GC" << std::endl;
    auto spent = service.spend({s.alice.id, s.gold_coins.id, "249.99", "demo-spend-1", std::nullopt, std::nullopt});
    if (spent.is_ok() && spent.value().remaining_balance) {
        std::cout << "   remaining: " << spent.value().remaining_balance->toString() << std::endl;
    }

    std::cout << "\nBob tries to spend 9999 GC" << std::endl;
    auto overspend = service.spend({s.bob.id, s.gold_coins.id, "9999", "demo-spend-2", std::nullopt, std::nullopt});
    if (!overspend.is_ok()) {
        std::cout << "   " << errorKindName(overspend.error()) << ": " << errorMessage(overspend.error())
                  << (isRetrySafe(overspend.error()) ? " (retry-safe)" : " (do not retry)") << std::endl;
    }

    // ===========================================
    // Step 3: Queries
    // ===========================================

    std::cout << "\nFinal balances:" << std::endl;
    printBalance(service, s.alice, s.gold_coins);
    printBalance(service, s.bob, s.gold_coins);
    printBalance(service, s.bob, s.loyalty_points);
    printBalance(service, s.bob, s.diamonds);

    std::cout << "\nAlice's history (newest first):" << std::endl;
    auto history = service.getHistory({s.alice.id, std::nullopt});
    if (history.is_ok()) {
        for (const auto &item : history.value()) {
            std::cout << "   " << ledger::transferKindToString(item.kind) << " " << item.amount.toString() << " ["
                      << ledger::txStatusToString(item.status) << "] " << item.description.value_or("") << std::endl;
        }
    }

    // ===========================================
    // Step 4: Audit
    // ===========================================

    auto report = service.verifyIntegrity();
    if (!report.is_ok()) {
        std::cerr << "\nIntegrity check failed: " << errorMessage(report.error()) << std::endl;
        return 1;
    }
    std::cout << "\nAudit chain: " << report.value().entries_checked << " entries, "
              << (report.value().intact ? "intact" : report.value().reason) << std::endl;

    db.close();
    std::cout << "\n=== Demo complete ===" << std::endl;
    return 0;
}
