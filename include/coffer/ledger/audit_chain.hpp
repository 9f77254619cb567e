#pragma once

#include <cstdint>
#include <datapod/datapod.hpp>
#include <optional>
#include <string>
#include <vector>

#include <coffer/storage/connection.hpp>

#include "types.hpp"

namespace coffer::ledger {

    /// Outcome of a full chain walk
    struct AuditReport {
        bool intact = true;
        int64_t entries_checked = 0;
        std::optional<int64_t> first_broken_sequence;
        std::string reason;
    };

    /// Per-asset totals from the zero-sum check
    struct AssetTotals {
        std::string asset_type_id;
        Amount credits;
        Amount debits;

        bool balanced() const { return credits == debits; }
    };

    // ===========================================
    // AuditChain - hash-linked ledger entries
    // ===========================================

    /// Each entry commits to its predecessor through prev_hash, so any edit
    /// or removal of a stored entry breaks every hash after it.
    class AuditChain {
      public:
        /// prev_hash of the very first entry: 64 zeros
        static std::string genesisHash();

        /// Deterministic text covering every stored field except sequence and entry_hash
        static std::string canonicalForm(const LedgerEntry &entry);

        /// SHA-256 over canonicalForm(), lowercase hex
        static dp::Result<std::string, dp::Error> computeEntryHash(const LedgerEntry &entry);

        /// Check linkage and hashes of an ordered run of entries
        static dp::Result<AuditReport, dp::Error> verifyEntries(const std::vector<LedgerEntry> &entries);

        /// Walk the whole stored log
        static dp::Result<AuditReport, dp::Error> verify(storage::Connection &conn);

        /// Credits into and debits out of wallets of each asset. Every asset
        /// must balance, and every entry must move value between two wallets
        /// of its own asset.
        static dp::Result<std::vector<AssetTotals>, dp::Error> zeroSumTotals(storage::Connection &conn);

        /// Internal error naming the first asset whose totals differ
        static dp::Result<void, dp::Error> verifyZeroSum(storage::Connection &conn);
    };

} // namespace coffer::ledger
