#ifndef OWNERSHIP_GUARD_HPP_
#define OWNERSHIP_GUARD_HPP_

#include "core/result.hpp"
#include "storage/ledger_store.hpp"

namespace ledger {

/**
 * Confirms that `account_id` exists and belongs to `caller`.
 *
 * Returns the account row on success. A missing account and an account owned
 * by someone else produce the same NOT_FOUND error, so callers cannot probe
 * for accounts they do not own. StorageError propagates to the caller.
 */
core::Result<core::Account> verifyOwnership(storage::AccountStore& accounts,
                                            core::OwnerId caller,
                                            core::AccountId account_id,
                                            storage::LockMode lock = storage::LockMode::NONE);

}  // namespace ledger

#endif  // OWNERSHIP_GUARD_HPP_
