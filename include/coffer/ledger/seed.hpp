#pragma once

#include <datapod/datapod.hpp>

#include <coffer/storage/database.hpp>

#include "transaction_coordinator.hpp"
#include "types.hpp"

namespace coffer::ledger {

    /// Reference rows created (or found) by seedDefaults()
    struct SeedResult {
        AssetType gold_coins;
        AssetType diamonds;
        AssetType loyalty_points;
        User treasury;
        User alice;
        User bob;
    };

    /// Demo data: GC, DIA and LP assets, the treasury user, alice and bob.
    /// Opening balances go through `coordinator` with fixed "seed-*" keys,
    /// so running it again changes nothing.
    dp::Result<SeedResult, dp::Error> seedDefaults(storage::Database &db, TransactionCoordinator &coordinator);

} // namespace coffer::ledger
