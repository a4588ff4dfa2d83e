#ifndef STORAGE_MEMORY_LEDGER_STORE_HPP_
#define STORAGE_MEMORY_LEDGER_STORE_HPP_

#include "storage/ledger_store.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ledger {
namespace storage {

/**
 * Places where the in-memory engine can be told to fail, so tests can check
 * that a unit of work is all-or-nothing.
 */
enum class FaultPoint {
  INSERT_ACCOUNT,
  READ_ACCOUNT,
  ADJUST_BALANCE,
  APPEND_TRANSACTION,
  READ_TRANSACTION,
  COMMIT
};

/**
 * In-process storage engine.
 *
 * Isolation is serializable: a read-write unit of work holds the engine lock
 * exclusively for its whole life, read-only units share it. Writes are applied
 * in place and an undo log restores the previous state on rollback, so no
 * other unit of work ever sees a half-applied change. Ids come from sequences
 * that, like database sequences, are not rewound by a rollback.
 */
class MemoryLedgerStore : public LedgerStore {
 public:
  using Clock = std::function<core::Timestamp()>;

  explicit MemoryLedgerStore(std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000),
                             Clock clock = Clock());
  ~MemoryLedgerStore() override = default;

  // Non-copyable
  MemoryLedgerStore(const MemoryLedgerStore&) = delete;
  MemoryLedgerStore& operator=(const MemoryLedgerStore&) = delete;

  std::unique_ptr<UnitOfWork> begin(AccessMode mode) override;

  void close() override;

  /**
   * After `skip` further hits of `point` pass, the next `occurrences` hits
   * throw StorageError.
   */
  void injectFault(FaultPoint point, int occurrences = 1, int skip = 0);
  void clearFaults();

 private:
  friend class MemoryUnitOfWork;

  struct Tables {
    std::map<core::AccountId, core::Account> accounts;
    std::unordered_map<std::string, core::AccountId> account_by_number;
    std::map<std::pair<core::OwnerId, core::AccountType>, core::AccountId> account_by_owner_type;
    std::map<core::TransactionId, core::TransactionRecord> transactions;
    std::unordered_map<core::AccountId, std::vector<core::TransactionId>> transactions_by_account;
    core::AccountId next_account_id = 1;
    core::TransactionId next_transaction_id = 1;
  };

  // Throws StorageError when a fault is armed for `point`.
  void checkFault(FaultPoint point);

  core::Timestamp now();

  std::chrono::milliseconds lock_timeout_;
  Clock clock_;
  core::Timestamp last_timestamp_ = 0;

  std::shared_timed_mutex engine_mutex_;
  Tables tables_;

  std::mutex fault_mutex_;
  struct ArmedFault {
    int skip = 0;
    int remaining = 0;
  };
  std::map<FaultPoint, ArmedFault> armed_faults_;

  std::atomic<bool> closed_{false};
};

}  // namespace storage
}  // namespace ledger

#endif  // STORAGE_MEMORY_LEDGER_STORE_HPP_
