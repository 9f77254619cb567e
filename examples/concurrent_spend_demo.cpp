/**
 * Example: many clients racing to spend the same wallet
 *
 * Ten threads each try to spend 10 GC from a wallet holding 50 GC.
 * Exactly five succeed; the rest are told the balance is insufficient.
 * A second round replays one idempotency key from every thread and
 * shows that it commits once.
 */

#include <coffer.hpp>
#include <atomic>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

using namespace coffer;

int main() {
    const std::string path = "concurrent_spend_demo.db";
    for (const auto &suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path + suffix);
    }

    storage::Database db;
    if (!db.open(path).is_ok() || !db.initializeSchema().is_ok()) {
        std::cerr << "Failed to prepare database " << path << std::endl;
        return 1;
    }

    api::WalletService service(db);
    auto seeded = service.seedDefaults();
    if (!seeded.is_ok()) {
        std::cerr << "Seeding failed: " << errorMessage(seeded.error()) << std::endl;
        return 1;
    }
    const auto &s = seeded.value();

    // Bob starts with 500 GC; bring him down to 50
    auto drained = service.spend({s.bob.id, s.gold_coins.id, "450", "drain-bob", std::nullopt, std::nullopt});
    if (!drained.is_ok()) {
        std::cerr << "Setup spend failed: " << errorMessage(drained.error()) << std::endl;
        return 1;
    }

    // ===========================================
    // Round 1: distinct keys
    // ===========================================

    std::cout << "Round 1: 10 spends of 10 GC against 50 GC" << std::endl;

    std::atomic<int> ok{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&, i] {
            auto r = service.spend(
                {s.bob.id, s.gold_coins.id, "10", "race-" + std::to_string(i), std::nullopt, std::nullopt});
            if (r.is_ok()) {
                ok++;
            } else {
                rejected++;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }
    threads.clear();

    std::cout << "   succeeded: " << ok.load() << ", rejected: " << rejected.load() << std::endl;
    std::cout << "   balance:   " << service.getBalance({s.bob.id, s.gold_coins.id}).value().balanceString()
              << std::endl;

    // ===========================================
    // Round 2: one key, many senders
    // ===========================================

    std::cout << "\nRound 2: 8 top-ups sharing one idempotency key" << std::endl;

    std::atomic<int> fresh{0};
    std::atomic<int> replays{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto r = service.topUp({s.bob.id, s.gold_coins.id, "25", "shared-key", std::nullopt, std::nullopt});
            if (r.is_ok()) {
                (r.value().replay ? replays : fresh)++;
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    std::cout << "   committed: " << fresh.load() << ", replayed: " << replays.load() << std::endl;
    std::cout << "   balance:   " << service.getBalance({s.bob.id, s.gold_coins.id}).value().balanceString()
              << std::endl;

    auto report = service.verifyIntegrity();
    std::cout << "\nLedger integrity: " << (report.is_ok() && report.value().intact ? "OK" : "FAILED") << std::endl;

    db.close();
    return report.is_ok() && report.value().intact ? 0 : 1;
}
