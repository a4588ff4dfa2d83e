#include "account_opener.hpp"
#include "observability/logger.hpp"

namespace ledger {

AccountOpener::AccountOpener(storage::LedgerStore& store,
                             const core::AccountNumberGenerator& generator,
                             observability::MetricsCollector& metrics)
    : store_(store), generator_(generator), metrics_(metrics) {
}

core::Result<core::Account> AccountOpener::execute(core::OwnerId caller, core::AccountType type) {
  if (auto violation = core::ownerIdIsPositive(caller)) {
    return core::Error::validationFailed({*violation});
  }

  std::optional<core::Result<core::Account>> outcome;
  for (int i = 0; i < generator_.maxAttempts(); ++i) {
    try {
      if (attempt(caller, type, outcome) == Attempt::DONE) {
        return std::move(*outcome);
      }
    } catch (const core::IdentifierSpaceExhausted& e) {
      LOG_BUILDER(observability::LogLevel::ERROR, "Account number space exhausted", "account_opener")
          .field("owner_id", caller)
          .field("error", e.what());
      return core::Error::internalFailure("Could not allocate an account number");
    } catch (const storage::StorageError& e) {
      LOG_BUILDER(observability::LogLevel::ERROR, "Account opening failed", "account_opener")
          .field("owner_id", caller)
          .field("type", core::toString(type))
          .field("error", e.what());
      return core::Error::internalFailure();
    } catch (const std::exception& e) {
      LOG_BUILDER(observability::LogLevel::ERROR, "Account opening failed", "account_opener")
          .field("owner_id", caller)
          .field("error", e.what());
      return core::Error::internalFailure();
    }
  }

  LOG_BUILDER(observability::LogLevel::ERROR, "Account number kept colliding on insert",
              "account_opener")
      .field("owner_id", caller)
      .field("attempts", generator_.maxAttempts());
  return core::Error::internalFailure("Could not allocate an account number");
}

AccountOpener::Attempt AccountOpener::attempt(core::OwnerId caller, core::AccountType type,
                                              std::optional<core::Result<core::Account>>& outcome) {
  auto uow = store_.begin(storage::AccessMode::READ_WRITE);
  auto& accounts = uow->accounts();

  if (accounts.findByOwnerAndType(caller, type)) {
    LOG_BUILDER(observability::LogLevel::WARN, "Account type already held", "account_opener")
        .field("owner_id", caller)
        .field("type", core::toString(type));
    outcome = core::Error::conflict("You already have a " + core::toString(type) + " account");
    return Attempt::DONE;
  }

  storage::NewAccount row;
  row.owner_id = caller;
  row.type = type;
  row.account_number = generator_.generate(
      [&accounts](const std::string& candidate) { return accounts.accountNumberExists(candidate); });

  core::AccountId id = 0;
  try {
    id = accounts.insert(row);
  } catch (const storage::DuplicateKeyError& e) {
    if (e.key() == storage::DuplicateKeyError::Key::OWNER_AND_TYPE) {
      outcome = core::Error::conflict("You already have a " + core::toString(type) + " account");
      return Attempt::DONE;
    }
    LOG_BUILDER(observability::LogLevel::WARN, "Account number taken concurrently, retrying",
                "account_opener")
        .field("owner_id", caller);
    return Attempt::RETRY;
  }

  std::optional<core::Account> created;
  try {
    created = accounts.findById(id, storage::LockMode::NONE);
  } catch (const storage::StorageError& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Read-back of new account failed", "account_opener")
        .field("account_id", id)
        .field("error", e.what());
  }
  if (!created) {
    outcome = core::Error::internalFailure(
        "Account was created but could not be retrieved. Please try again.");
    return Attempt::DONE;
  }

  uow->commit();

  metrics_.incrementCounter(observability::kAccountsOpenedTotal);
  LOG_BUILDER(observability::LogLevel::INFO, "Account opened", "account_opener")
      .field("account_id", created->id)
      .field("owner_id", caller)
      .field("type", core::toString(type));
  outcome = *created;
  return Attempt::DONE;
}

}  // namespace ledger
