#include "history_query.hpp"
#include "ownership_guard.hpp"
#include "observability/logger.hpp"

namespace ledger {

core::Result<std::vector<core::TransactionView>> listTransactionHistory(
    storage::LedgerStore& store, core::OwnerId caller, core::AccountId account_id) {
  if (auto violation = core::accountIdIsPositive(account_id)) {
    return core::Error::validationFailed({*violation});
  }

  try {
    auto uow = store.begin(storage::AccessMode::READ_ONLY);

    auto account = verifyOwnership(uow->accounts(), caller, account_id);
    if (!account) {
      return account.error();
    }

    auto rows = uow->transactions().listForAccount(account_id);
    uow->commit();

    std::vector<core::TransactionView> history;
    history.reserve(rows.size());
    for (auto& row : rows) {
      history.push_back(core::TransactionView{std::move(row), account->type});
    }

    LOG_BUILDER(observability::LogLevel::DEBUG, "Transaction history read", "history")
        .field("account_id", account_id)
        .field("rows", static_cast<long long>(history.size()));
    return history;
  } catch (const storage::StorageError& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Transaction history read failed", "history")
        .field("account_id", account_id)
        .field("error", e.what());
    return core::Error::internalFailure();
  }
}

}  // namespace ledger
