#ifndef STORAGE_LEDGER_STORE_HPP_
#define STORAGE_LEDGER_STORE_HPP_

#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger {
namespace storage {

/**
 * Raised by a storage engine that could not complete a read, write or commit.
 * The enclosing unit of work must be treated as rolled back.
 */
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Raised when an insert violates a uniqueness rule.
 */
class DuplicateKeyError : public StorageError {
 public:
  enum class Key {
    ACCOUNT_NUMBER,
    OWNER_AND_TYPE
  };

  DuplicateKeyError(Key key, const std::string& message) : StorageError(message), key_(key) {}

  Key key() const { return key_; }

 private:
  Key key_;
};

enum class AccessMode {
  READ_ONLY,
  READ_WRITE
};

enum class LockMode {
  NONE,
  FOR_UPDATE
};

struct NewAccount {
  std::string account_number;
  core::OwnerId owner_id = 0;
  core::AccountType type = core::AccountType::CHECKING;
};

struct NewTransaction {
  core::AccountId account_id = 0;
  core::TransactionType type = core::TransactionType::DEPOSIT;
  core::Money amount = 0;
  std::string description;
  core::TransactionStatus status = core::TransactionStatus::COMPLETED;
};

struct TransactionSummary {
  std::int64_t count = 0;
  core::Money completed_sum = 0;
};

/**
 * Account table capability. Balance is only ever changed through adjustBalance.
 */
class AccountStore {
 public:
  virtual ~AccountStore() = default;

  virtual std::optional<core::Account> findById(core::AccountId id, LockMode lock) = 0;
  virtual std::optional<core::Account> findByOwnerAndType(core::OwnerId owner,
                                                          core::AccountType type) = 0;
  virtual std::vector<core::Account> listByOwner(core::OwnerId owner) = 0;
  virtual bool accountNumberExists(const std::string& account_number) = 0;

  /**
   * Inserts a zero-balance active account and returns its store-assigned id.
   */
  virtual core::AccountId insert(const NewAccount& account) = 0;

  /**
   * Applies balance = balance + delta inside the engine and returns the
   * engine's value after the update. nullopt when no active row matched.
   */
  virtual std::optional<core::Money> adjustBalance(core::AccountId id, core::Money delta) = 0;

  /**
   * Administrative status change. Returns false when the account does not exist.
   */
  virtual bool setStatus(core::AccountId id, core::AccountStatus status) = 0;
};

/**
 * Append-only transaction log capability.
 */
class TransactionLog {
 public:
  virtual ~TransactionLog() = default;

  /**
   * Inserts a row; the store assigns id, created_at and processed_at.
   */
  virtual core::TransactionRecord append(const NewTransaction& transaction) = 0;
  virtual std::optional<core::TransactionRecord> findById(core::TransactionId id) = 0;

  /**
   * All rows for the account, most recent first, ties broken by id descending.
   */
  virtual std::vector<core::TransactionRecord> listForAccount(core::AccountId account_id) = 0;
  virtual TransactionSummary summarize(core::AccountId account_id) = 0;
};

/**
 * One storage-engine transaction. Everything done through accounts() and
 * transactions() becomes visible to others at commit(), or never.
 * Destroying an uncommitted unit of work rolls it back.
 */
class UnitOfWork {
 public:
  virtual ~UnitOfWork() = default;

  virtual AccountStore& accounts() = 0;
  virtual TransactionLog& transactions() = 0;

  /**
   * Throws StorageError if the engine refuses the commit; nothing is applied then.
   */
  virtual void commit() = 0;
};

/**
 * Storage handle owned by the composition root and injected into the ledger.
 */
class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  virtual std::unique_ptr<UnitOfWork> begin(AccessMode mode) = 0;

  virtual void close() = 0;
};

}  // namespace storage
}  // namespace ledger

#endif  // STORAGE_LEDGER_STORE_HPP_
