#include "ownership_guard.hpp"
#include "observability/logger.hpp"

namespace ledger {

core::Result<core::Account> verifyOwnership(storage::AccountStore& accounts,
                                            core::OwnerId caller,
                                            core::AccountId account_id,
                                            storage::LockMode lock) {
  auto account = accounts.findById(account_id, lock);

  if (!account) {
    LOG_BUILDER(observability::LogLevel::DEBUG, "Ownership check failed: no such account",
                "ownership_guard")
        .field("account_id", account_id)
        .field("caller", caller);
    return core::Error::notFound();
  }

  if (account->owner_id != caller) {
    LOG_BUILDER(observability::LogLevel::DEBUG, "Ownership check failed: owner mismatch",
                "ownership_guard")
        .field("account_id", account_id)
        .field("caller", caller);
    return core::Error::notFound();
  }

  return *account;
}

}  // namespace ledger
