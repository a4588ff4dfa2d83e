#include "funding_operation.hpp"
#include "ownership_guard.hpp"
#include "observability/logger.hpp"

namespace ledger {

FundingOperation::FundingOperation(storage::LedgerStore& store,
                                   const core::FundingLimits& limits,
                                   observability::MetricsCollector& metrics)
    : store_(store), limits_(limits), metrics_(metrics) {
}

std::string FundingOperation::describe(core::FundingSourceType source) {
  return "Funding from " + core::toString(source);
}

core::Result<core::FundingResult> FundingOperation::execute(core::OwnerId caller,
                                                            const core::FundingRequest& request) {
  observability::MetricsCollector::Timer timer(metrics_, observability::kFundDurationSeconds);

  auto violations = core::validateFundingRequest(request, limits_);
  if (!violations.empty()) {
    metrics_.incrementCounter(observability::kFundFailedTotal);
    LOG_BUILDER(observability::LogLevel::WARN, "Funding request rejected", "funding")
        .field("account_id", request.account_id)
        .field("rule", violations.front().rule)
        .field("violations", static_cast<long long>(violations.size()));
    return core::Error::validationFailed(std::move(violations));
  }

  core::Result<core::FundingResult> result = core::Error::internalFailure();
  try {
    result = apply(caller, request);
  } catch (const storage::StorageError& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Funding rolled back after storage failure",
                "funding")
        .field("account_id", request.account_id)
        .field("amount_cents", request.amount)
        .field("error", e.what());
    result = core::Error::internalFailure();
  } catch (const std::exception& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Funding rolled back", "funding")
        .field("account_id", request.account_id)
        .field("error", e.what());
    result = core::Error::internalFailure();
  }

  if (!result) {
    metrics_.incrementCounter(observability::kFundFailedTotal);
    return result;
  }

  metrics_.incrementCounter(observability::kFundTotal);
  metrics_.incrementCounter(observability::kFundAmountCentsTotal, static_cast<double>(request.amount));
  LOG_BUILDER(observability::LogLevel::INFO, "Account funded", "funding")
      .field("account_id", request.account_id)
      .field("transaction_id", result->transaction.id)
      .field("amount_cents", request.amount)
      .field("new_balance_cents", result->new_balance)
      .field("source", core::toString(request.source.type));
  return result;
}

core::Result<core::FundingResult> FundingOperation::apply(core::OwnerId caller,
                                                          const core::FundingRequest& request) {
  auto uow = store_.begin(storage::AccessMode::READ_WRITE);

  auto account = verifyOwnership(uow->accounts(), caller, request.account_id,
                                 storage::LockMode::FOR_UPDATE);
  if (!account) {
    return account.error();
  }

  if (account->status != core::AccountStatus::ACTIVE) {
    LOG_BUILDER(observability::LogLevel::WARN, "Funding refused for inactive account", "funding")
        .field("account_id", account->id)
        .field("status", core::toString(account->status));
    return core::Error::invalidState("Account is not active");
  }

  storage::NewTransaction row;
  row.account_id = account->id;
  row.type = core::TransactionType::DEPOSIT;
  row.amount = request.amount;
  row.description = describe(request.source.type);
  row.status = core::TransactionStatus::COMPLETED;

  auto appended = uow->transactions().append(row);

  auto balance = uow->accounts().adjustBalance(account->id, request.amount);
  if (!balance) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Balance update matched no active account",
                "funding")
        .field("account_id", account->id);
    return core::Error::internalFailure();
  }

  auto stored_tx = uow->transactions().findById(appended.id);
  auto stored_account = uow->accounts().findById(account->id, storage::LockMode::NONE);
  if (!stored_tx || !stored_account) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Read-back after funding failed", "funding")
        .field("account_id", account->id)
        .field("transaction_id", appended.id);
    return core::Error::internalFailure();
  }
  if (stored_account->balance != *balance) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Read-back balance disagrees with update",
                "funding")
        .field("account_id", account->id)
        .field("updated_cents", *balance)
        .field("read_cents", stored_account->balance);
    return core::Error::internalFailure();
  }

  uow->commit();

  core::FundingResult funded;
  funded.transaction = *stored_tx;
  funded.new_balance = stored_account->balance;
  return funded;
}

}  // namespace ledger
