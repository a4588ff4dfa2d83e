#ifndef ACCOUNT_OPENER_HPP_
#define ACCOUNT_OPENER_HPP_

#include "core/account_number_generator.hpp"
#include "core/result.hpp"
#include "observability/metrics.hpp"
#include "storage/ledger_store.hpp"

namespace ledger {

/**
 * Opens a zero-balance active account of a given type for an owner.
 *
 * The insert and its read-back run in one unit of work. If the read-back
 * fails the unit of work is rolled back and INTERNAL_FAILURE is returned,
 * so a retry starts clean. An account number taken by a concurrent writer
 * between generation and insert causes a fresh attempt, up to the
 * generator's attempt budget.
 */
class AccountOpener {
 public:
  AccountOpener(storage::LedgerStore& store,
                const core::AccountNumberGenerator& generator,
                observability::MetricsCollector& metrics);

  core::Result<core::Account> execute(core::OwnerId caller, core::AccountType type);

 private:
  enum class Attempt {
    DONE,
    RETRY
  };

  Attempt attempt(core::OwnerId caller, core::AccountType type,
                  std::optional<core::Result<core::Account>>& outcome);

  storage::LedgerStore& store_;
  const core::AccountNumberGenerator& generator_;
  observability::MetricsCollector& metrics_;
};

}  // namespace ledger

#endif  // ACCOUNT_OPENER_HPP_
