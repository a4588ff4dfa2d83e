#include "ledger_service.hpp"
#include "account_opener.hpp"
#include "funding_operation.hpp"
#include "history_query.hpp"
#include "ownership_guard.hpp"
#include "observability/logger.hpp"

#include <stdexcept>

namespace ledger {

LedgerService::LedgerService(std::shared_ptr<storage::LedgerStore> store, const Options& options,
                             observability::MetricsCollector& metrics)
    : LedgerService(std::move(store), options,
                    core::AccountNumberGenerator(options.account_number_max_attempts), metrics) {
}

LedgerService::LedgerService(std::shared_ptr<storage::LedgerStore> store, const Options& options,
                             core::AccountNumberGenerator generator,
                             observability::MetricsCollector& metrics)
    : store_(std::move(store)),
      options_(options),
      generator_(std::move(generator)),
      metrics_(metrics) {
  if (!store_) {
    throw std::invalid_argument("LedgerService requires a storage handle");
  }
}

core::Result<core::Account> LedgerService::openAccount(core::OwnerId caller,
                                                       core::AccountType type) {
  AccountOpener opener(*store_, generator_, metrics_);
  return opener.execute(caller, type);
}

core::Result<core::FundingResult> LedgerService::fund(core::OwnerId caller,
                                                      const core::FundingRequest& request) {
  FundingOperation operation(*store_, options_.limits, metrics_);
  return operation.execute(caller, request);
}

core::Result<std::vector<core::TransactionView>> LedgerService::listTransactions(
    core::OwnerId caller, core::AccountId account_id) {
  return listTransactionHistory(*store_, caller, account_id);
}

core::Result<std::vector<core::Account>> LedgerService::listAccounts(core::OwnerId caller) {
  if (auto violation = core::ownerIdIsPositive(caller)) {
    return core::Error::validationFailed({*violation});
  }

  try {
    auto uow = store_->begin(storage::AccessMode::READ_ONLY);
    auto accounts = uow->accounts().listByOwner(caller);
    uow->commit();
    return accounts;
  } catch (const storage::StorageError& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Account listing failed", "ledger")
        .field("owner_id", caller)
        .field("error", e.what());
    return core::Error::internalFailure();
  }
}

core::Result<core::Account> LedgerService::getAccount(core::OwnerId caller,
                                                      core::AccountId account_id) {
  if (auto violation = core::accountIdIsPositive(account_id)) {
    return core::Error::validationFailed({*violation});
  }

  try {
    auto uow = store_->begin(storage::AccessMode::READ_ONLY);
    auto account = verifyOwnership(uow->accounts(), caller, account_id);
    uow->commit();
    return account;
  } catch (const storage::StorageError& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Account read failed", "ledger")
        .field("account_id", account_id)
        .field("error", e.what());
    return core::Error::internalFailure();
  }
}

core::Result<core::Reconciliation> LedgerService::reconcile(core::OwnerId caller,
                                                            core::AccountId account_id) {
  if (auto violation = core::accountIdIsPositive(account_id)) {
    return core::Error::validationFailed({*violation});
  }

  try {
    auto uow = store_->begin(storage::AccessMode::READ_ONLY);
    auto account = verifyOwnership(uow->accounts(), caller, account_id);
    if (!account) {
      return account.error();
    }
    auto summary = uow->transactions().summarize(account_id);
    uow->commit();

    core::Reconciliation report;
    report.account_id = account_id;
    report.balance = account->balance;
    report.completed_sum = summary.completed_sum;
    report.transaction_count = summary.count;
    report.consistent = report.balance == report.completed_sum;

    if (!report.consistent) {
      LOG_BUILDER(observability::LogLevel::ERROR, "Balance does not match transaction log", "ledger")
          .field("account_id", account_id)
          .field("balance_cents", report.balance)
          .field("completed_sum_cents", report.completed_sum);
    }
    return report;
  } catch (const storage::StorageError& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Reconciliation failed", "ledger")
        .field("account_id", account_id)
        .field("error", e.what());
    return core::Error::internalFailure();
  }
}

core::Result<core::Account> LedgerService::setAccountStatus(core::AccountId account_id,
                                                            core::AccountStatus status) {
  if (auto violation = core::accountIdIsPositive(account_id)) {
    return core::Error::validationFailed({*violation});
  }

  try {
    auto uow = store_->begin(storage::AccessMode::READ_WRITE);
    if (!uow->accounts().setStatus(account_id, status)) {
      return core::Error::notFound();
    }
    auto account = uow->accounts().findById(account_id, storage::LockMode::NONE);
    if (!account) {
      return core::Error::internalFailure();
    }
    uow->commit();

    LOG_BUILDER(observability::LogLevel::INFO, "Account status changed", "ledger")
        .field("account_id", account_id)
        .field("status", core::toString(status));
    return *account;
  } catch (const storage::StorageError& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Account status change failed", "ledger")
        .field("account_id", account_id)
        .field("error", e.what());
    return core::Error::internalFailure();
  }
}

}  // namespace ledger
