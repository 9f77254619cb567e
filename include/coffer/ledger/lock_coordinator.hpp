#pragma once

#include <algorithm>
#include <datapod/datapod.hpp>
#include <string>
#include <vector>

#include <coffer/storage/unit_of_work.hpp>

namespace coffer::ledger {

    /// Takes wallet locks in ascending id order so that two units needing the
    /// same wallets always queue in the same order and can never wait on each other
    /// in a cycle.
    class LockCoordinator {
      public:
        LockCoordinator() = default;

        /// Distinct ids, lexically sorted
        static inline std::vector<std::string> lockOrder(std::vector<std::string> wallet_ids) {
            std::sort(wallet_ids.begin(), wallet_ids.end());
            wallet_ids.erase(std::unique(wallet_ids.begin(), wallet_ids.end()), wallet_ids.end());
            return wallet_ids;
        }

        /// Lock every wallet, one at a time, in lockOrder(). The locks belong to
        /// `unit` and are released when it commits or rolls back.
        inline dp::Result<void, dp::Error> lockInOrder(storage::UnitOfWork &unit,
                                                       const std::vector<std::string> &wallet_ids) const {
            for (const auto &id : lockOrder(wallet_ids)) {
                auto locked = unit.lock(id);
                if (!locked.is_ok()) {
                    return locked;
                }
            }
            return dp::Result<void, dp::Error>::ok();
        }
    };

} // namespace coffer::ledger
