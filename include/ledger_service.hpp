#ifndef LEDGER_SERVICE_HPP_
#define LEDGER_SERVICE_HPP_

#include "core/account_number_generator.hpp"
#include "core/result.hpp"
#include "core/validation.hpp"
#include "observability/metrics.hpp"
#include "storage/ledger_store.hpp"

#include <memory>
#include <vector>

namespace ledger {

/**
 * Entry point for account and funding operations.
 *
 * Every caller-facing operation takes the authenticated owner id first and
 * reports failures as a core::Error; storage exceptions never escape.
 */
class LedgerService {
 public:
  struct Options {
    core::FundingLimits limits;
    int account_number_max_attempts = core::AccountNumberGenerator::kDefaultMaxAttempts;
  };

  LedgerService(std::shared_ptr<storage::LedgerStore> store, const Options& options,
                observability::MetricsCollector& metrics = observability::getGlobalMetrics());

  // Uses the given generator in place of the OpenSSL-backed one.
  LedgerService(std::shared_ptr<storage::LedgerStore> store, const Options& options,
                core::AccountNumberGenerator generator,
                observability::MetricsCollector& metrics = observability::getGlobalMetrics());

  // Non-copyable
  LedgerService(const LedgerService&) = delete;
  LedgerService& operator=(const LedgerService&) = delete;

  /**
   * Opens a zero-balance active account. CONFLICT if the caller already holds
   * an account of this type.
   */
  core::Result<core::Account> openAccount(core::OwnerId caller, core::AccountType type);

  /**
   * Credits `request.amount` to one of the caller's active accounts and
   * returns the new transaction together with the committed balance.
   */
  core::Result<core::FundingResult> fund(core::OwnerId caller, const core::FundingRequest& request);

  core::Result<std::vector<core::TransactionView>> listTransactions(core::OwnerId caller,
                                                                    core::AccountId account_id);

  // Accounts owned by the caller, ordered by id.
  core::Result<std::vector<core::Account>> listAccounts(core::OwnerId caller);

  core::Result<core::Account> getAccount(core::OwnerId caller, core::AccountId account_id);

  /**
   * Compares the stored balance with the sum of the account's completed
   * transactions in one snapshot.
   */
  core::Result<core::Reconciliation> reconcile(core::OwnerId caller, core::AccountId account_id);

  /**
   * Back-office status change. Not owner-scoped and never touches the balance.
   */
  core::Result<core::Account> setAccountStatus(core::AccountId account_id,
                                               core::AccountStatus status);

 private:
  std::shared_ptr<storage::LedgerStore> store_;
  Options options_;
  core::AccountNumberGenerator generator_;
  observability::MetricsCollector& metrics_;
};

}  // namespace ledger

#endif  // LEDGER_SERVICE_HPP_
