#ifndef HISTORY_QUERY_HPP_
#define HISTORY_QUERY_HPP_

#include "core/result.hpp"
#include "storage/ledger_store.hpp"

#include <vector>

namespace ledger {

/**
 * Transaction history of one account, most recent first.
 *
 * The ownership check and the log read share one read-only unit of work, so
 * both see the same snapshot. Each row carries the owning account's type.
 */
core::Result<std::vector<core::TransactionView>> listTransactionHistory(
    storage::LedgerStore& store, core::OwnerId caller, core::AccountId account_id);

}  // namespace ledger

#endif  // HISTORY_QUERY_HPP_
