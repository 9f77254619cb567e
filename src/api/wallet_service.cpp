#include <coffer/api/wallet_service.hpp>
#include <coffer/common/error.hpp>

namespace coffer::api {

    WalletService::WalletService(storage::Database &db, LedgerConfig config)
        : db_(db), config_(config), log_(config.log_level, "coffer.api"), coordinator_(db, config),
          queries_(db, config) {}

    dp::Result<ledger::TransferResult, dp::Error> WalletService::transfer(ledger::TransferKind kind,
                                                                          const TransferRequest &request) {
        auto cmd = validateTransfer(request, config_);
        if (!cmd.is_ok()) {
            log_.debug("Invalid " + ledger::transferKindToString(kind) + " request: " + errorMessage(cmd.error()));
            return dp::Result<ledger::TransferResult, dp::Error>::err(cmd.error());
        }
        return coordinator_.execute(kind, cmd.value());
    }

    dp::Result<ledger::TransferResult, dp::Error> WalletService::topUp(const TransferRequest &request) {
        return transfer(ledger::TransferKind::TopUp, request);
    }

    dp::Result<ledger::TransferResult, dp::Error> WalletService::bonus(const TransferRequest &request) {
        return transfer(ledger::TransferKind::Bonus, request);
    }

    dp::Result<ledger::TransferResult, dp::Error> WalletService::spend(const TransferRequest &request) {
        return transfer(ledger::TransferKind::Spend, request);
    }

    dp::Result<ledger::BalanceView, dp::Error> WalletService::getBalance(const BalanceRequest &request) {
        auto valid = validateBalance(request);
        if (!valid.is_ok()) {
            return dp::Result<ledger::BalanceView, dp::Error>::err(valid.error());
        }
        return queries_.getBalance(request.user_id, request.asset_type_id);
    }

    dp::Result<std::vector<ledger::HistoryItem>, dp::Error> WalletService::getHistory(const HistoryRequest &request) {
        auto valid = validateHistory(request);
        if (!valid.is_ok()) {
            return dp::Result<std::vector<ledger::HistoryItem>, dp::Error>::err(valid.error());
        }
        return queries_.getHistory(request.user_id, request.asset_type_id);
    }

    dp::Result<std::vector<ledger::AssetType>, dp::Error> WalletService::listAssetTypes() {
        return queries_.listAssetTypes();
    }

    dp::Result<std::vector<ledger::User>, dp::Error> WalletService::listUsers() { return queries_.listUsers(); }

    dp::Result<ledger::SeedResult, dp::Error> WalletService::seedDefaults() {
        auto seeded = ledger::seedDefaults(db_, coordinator_);
        if (seeded.is_ok()) {
            log_.info("Seed data in place");
        } else {
            log_.error("Seeding failed: " + errorMessage(seeded.error()));
        }
        return seeded;
    }

    dp::Result<ledger::AuditReport, dp::Error> WalletService::verifyIntegrity() {
        auto report = queries_.verifyAuditChain();
        if (!report.is_ok()) {
            return report;
        }
        if (!report.value().intact) {
            log_.error("Audit chain broken: " + report.value().reason);
            return report;
        }

        auto balanced = queries_.verifyZeroSum();
        if (!balanced.is_ok()) {
            log_.error("Zero-sum check failed: " + errorMessage(balanced.error()));
            return dp::Result<ledger::AuditReport, dp::Error>::err(balanced.error());
        }
        return report;
    }

} // namespace coffer::api
