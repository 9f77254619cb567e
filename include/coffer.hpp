#pragma once

// Coffer: append-only double-entry wallet ledger
// Composes storage, ledger and the request-facing api layer

#include "coffer/common/amount.hpp"
#include "coffer/common/config.hpp"
#include "coffer/common/error.hpp"
#include "coffer/common/log.hpp"
#include "coffer/storage/database.hpp"
#include "coffer/storage/unit_of_work.hpp"
#include "coffer/ledger/ledger.hpp"
#include "coffer/api/requests.hpp"
#include "coffer/api/wallet_service.hpp"
