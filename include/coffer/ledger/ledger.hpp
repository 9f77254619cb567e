#pragma once

#include "audit_chain.hpp"
#include "balance_calculator.hpp"
#include "idempotency_guard.hpp"
#include "journal.hpp"
#include "ledger_queries.hpp"
#include "lock_coordinator.hpp"
#include "reference_data.hpp"
#include "seed.hpp"
#include "transaction_coordinator.hpp"
#include "types.hpp"
#include "wallet_registry.hpp"

namespace coffer::ledger {
    // Aggregates ledger headers under coffer::ledger
}
