#include <coffer/api/requests.hpp>
#include <coffer/common/amount.hpp>
#include <coffer/common/error.hpp>
#include <coffer/common/ids.hpp>

namespace coffer::api {

    namespace {

        dp::Result<void, dp::Error> requireUuid(const std::string &field, const std::string &value) {
            if (!isUuid(value)) {
                return dp::Result<void, dp::Error>::err(validation_error(field + " must be a valid UUID"));
            }
            return dp::Result<void, dp::Error>::ok();
        }

    } // namespace

    dp::Result<ledger::TransferCommand, dp::Error> validateTransfer(const TransferRequest &request,
                                                                   const LedgerConfig &config) {
        auto user = requireUuid("userId", request.user_id);
        if (!user.is_ok()) {
            return dp::Result<ledger::TransferCommand, dp::Error>::err(user.error());
        }
        auto asset = requireUuid("assetTypeId", request.asset_type_id);
        if (!asset.is_ok()) {
            return dp::Result<ledger::TransferCommand, dp::Error>::err(asset.error());
        }

        auto amount = Amount::parse(request.amount);
        if (!amount.is_ok()) {
            return dp::Result<ledger::TransferCommand, dp::Error>::err(amount.error());
        }
        // "0.00004" rounds to zero and is rejected like "0"
        if (!amount.value().isPositive()) {
            return dp::Result<ledger::TransferCommand, dp::Error>::err(validation_error("amount must be positive"));
        }

        if (request.idempotency_key.empty() || request.idempotency_key.size() > config.max_idempotency_key_length) {
            return dp::Result<ledger::TransferCommand, dp::Error>::err(validation_error(
                "idempotencyKey must be 1-" + std::to_string(config.max_idempotency_key_length) + " characters"));
        }

        ledger::TransferCommand cmd;
        cmd.user_id = request.user_id;
        cmd.asset_type_id = request.asset_type_id;
        cmd.amount = amount.value();
        cmd.idempotency_key = request.idempotency_key;
        cmd.description = request.description;
        cmd.metadata = request.metadata;
        return dp::Result<ledger::TransferCommand, dp::Error>::ok(cmd);
    }

    dp::Result<BalanceRequest, dp::Error> validateBalance(const BalanceRequest &request) {
        auto user = requireUuid("userId", request.user_id);
        if (!user.is_ok()) {
            return dp::Result<BalanceRequest, dp::Error>::err(user.error());
        }
        auto asset = requireUuid("assetTypeId", request.asset_type_id);
        if (!asset.is_ok()) {
            return dp::Result<BalanceRequest, dp::Error>::err(asset.error());
        }
        return dp::Result<BalanceRequest, dp::Error>::ok(request);
    }

    dp::Result<HistoryRequest, dp::Error> validateHistory(const HistoryRequest &request) {
        auto user = requireUuid("userId", request.user_id);
        if (!user.is_ok()) {
            return dp::Result<HistoryRequest, dp::Error>::err(user.error());
        }
        if (request.asset_type_id) {
            auto asset = requireUuid("assetTypeId", *request.asset_type_id);
            if (!asset.is_ok()) {
                return dp::Result<HistoryRequest, dp::Error>::err(asset.error());
            }
        }
        return dp::Result<HistoryRequest, dp::Error>::ok(request);
    }

} // namespace coffer::api
