#include "storage/memory_ledger_store.hpp"

#include <algorithm>
#include <limits>

namespace ledger {
namespace storage {

class MemoryUnitOfWork : public UnitOfWork, public AccountStore, public TransactionLog {
 public:
  MemoryUnitOfWork(MemoryLedgerStore& store, AccessMode mode)
      : store_(store), tables_(store.tables_), mode_(mode), committed_(false) {
    bool acquired = false;
    if (mode_ == AccessMode::READ_WRITE) {
      exclusive_ = std::unique_lock<std::shared_timed_mutex>(store_.engine_mutex_, std::defer_lock);
      acquired = exclusive_.try_lock_for(store_.lock_timeout_);
    } else {
      shared_ = std::shared_lock<std::shared_timed_mutex>(store_.engine_mutex_, std::defer_lock);
      acquired = shared_.try_lock_for(store_.lock_timeout_);
    }
    if (!acquired) {
      throw StorageError("lock timeout: could not acquire storage engine lock");
    }
  }

  ~MemoryUnitOfWork() override {
    if (!committed_) {
      rollback();
    }
  }

  MemoryUnitOfWork(const MemoryUnitOfWork&) = delete;
  MemoryUnitOfWork& operator=(const MemoryUnitOfWork&) = delete;

  AccountStore& accounts() override { return *this; }
  TransactionLog& transactions() override { return *this; }

  void commit() override {
    if (committed_) return;
    store_.checkFault(FaultPoint::COMMIT);
    committed_ = true;
    undo_.clear();
    if (exclusive_.owns_lock()) exclusive_.unlock();
    if (shared_.owns_lock()) shared_.unlock();
  }

  // AccountStore

  std::optional<core::Account> findById(core::AccountId id, LockMode) override {
    store_.checkFault(FaultPoint::READ_ACCOUNT);
    auto it = tables_.accounts.find(id);
    if (it == tables_.accounts.end()) return std::nullopt;
    return it->second;
  }

  std::optional<core::Account> findByOwnerAndType(core::OwnerId owner,
                                                  core::AccountType type) override {
    store_.checkFault(FaultPoint::READ_ACCOUNT);
    auto it = tables_.account_by_owner_type.find({owner, type});
    if (it == tables_.account_by_owner_type.end()) return std::nullopt;
    return tables_.accounts.at(it->second);
  }

  std::vector<core::Account> listByOwner(core::OwnerId owner) override {
    store_.checkFault(FaultPoint::READ_ACCOUNT);
    std::vector<core::Account> result;
    for (const auto& [id, account] : tables_.accounts) {
      if (account.owner_id == owner) result.push_back(account);
    }
    return result;
  }

  bool accountNumberExists(const std::string& account_number) override {
    store_.checkFault(FaultPoint::READ_ACCOUNT);
    return tables_.account_by_number.count(account_number) > 0;
  }

  core::AccountId insert(const NewAccount& account) override {
    requireWritable();
    store_.checkFault(FaultPoint::INSERT_ACCOUNT);

    if (tables_.account_by_number.count(account.account_number) > 0) {
      throw DuplicateKeyError(DuplicateKeyError::Key::ACCOUNT_NUMBER,
                              "duplicate account number " + account.account_number);
    }
    auto owner_type = std::make_pair(account.owner_id, account.type);
    if (tables_.account_by_owner_type.count(owner_type) > 0) {
      throw DuplicateKeyError(DuplicateKeyError::Key::OWNER_AND_TYPE,
                              "owner already has a " + core::toString(account.type) + " account");
    }

    core::Account row;
    row.id = tables_.next_account_id++;
    row.account_number = account.account_number;
    row.owner_id = account.owner_id;
    row.type = account.type;
    row.balance = 0;
    row.status = core::AccountStatus::ACTIVE;
    row.created_at = store_.now();

    tables_.accounts.emplace(row.id, row);
    tables_.account_by_number.emplace(row.account_number, row.id);
    tables_.account_by_owner_type.emplace(owner_type, row.id);

    core::AccountId id = row.id;
    std::string number = row.account_number;
    undo_.push_back([this, id, number, owner_type]() {
      tables_.accounts.erase(id);
      tables_.account_by_number.erase(number);
      tables_.account_by_owner_type.erase(owner_type);
    });
    return id;
  }

  std::optional<core::Money> adjustBalance(core::AccountId id, core::Money delta) override {
    requireWritable();
    store_.checkFault(FaultPoint::ADJUST_BALANCE);

    auto it = tables_.accounts.find(id);
    if (it == tables_.accounts.end() || it->second.status != core::AccountStatus::ACTIVE) {
      return std::nullopt;
    }

    core::Money& balance = it->second.balance;
    if ((delta > 0 && balance > std::numeric_limits<core::Money>::max() - delta) ||
        (delta < 0 && balance < std::numeric_limits<core::Money>::min() - delta)) {
      throw StorageError("numeric overflow on balance of account " + std::to_string(id));
    }

    core::Money previous = balance;
    balance += delta;
    undo_.push_back([this, id, previous]() { tables_.accounts.at(id).balance = previous; });
    return balance;
  }

  bool setStatus(core::AccountId id, core::AccountStatus status) override {
    requireWritable();
    auto it = tables_.accounts.find(id);
    if (it == tables_.accounts.end()) return false;

    core::AccountStatus previous = it->second.status;
    it->second.status = status;
    undo_.push_back([this, id, previous]() { tables_.accounts.at(id).status = previous; });
    return true;
  }

  // TransactionLog

  core::TransactionRecord append(const NewTransaction& transaction) override {
    requireWritable();
    store_.checkFault(FaultPoint::APPEND_TRANSACTION);

    if (tables_.accounts.count(transaction.account_id) == 0) {
      throw StorageError("foreign key violation: account " +
                         std::to_string(transaction.account_id) + " does not exist");
    }

    core::TransactionRecord row;
    row.id = tables_.next_transaction_id++;
    row.account_id = transaction.account_id;
    row.type = transaction.type;
    row.amount = transaction.amount;
    row.description = transaction.description;
    row.status = transaction.status;
    row.created_at = store_.now();
    row.processed_at = row.created_at;

    tables_.transactions.emplace(row.id, row);
    tables_.transactions_by_account[row.account_id].push_back(row.id);

    core::TransactionId id = row.id;
    core::AccountId account_id = row.account_id;
    undo_.push_back([this, id, account_id]() {
      tables_.transactions.erase(id);
      auto& ids = tables_.transactions_by_account[account_id];
      ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    });
    return row;
  }

  std::optional<core::TransactionRecord> findById(core::TransactionId id) override {
    store_.checkFault(FaultPoint::READ_TRANSACTION);
    auto it = tables_.transactions.find(id);
    if (it == tables_.transactions.end()) return std::nullopt;
    return it->second;
  }

  std::vector<core::TransactionRecord> listForAccount(core::AccountId account_id) override {
    store_.checkFault(FaultPoint::READ_TRANSACTION);
    std::vector<core::TransactionRecord> rows;
    auto it = tables_.transactions_by_account.find(account_id);
    if (it == tables_.transactions_by_account.end()) return rows;

    rows.reserve(it->second.size());
    for (core::TransactionId id : it->second) {
      rows.push_back(tables_.transactions.at(id));
    }
    std::sort(rows.begin(), rows.end(),
              [](const core::TransactionRecord& a, const core::TransactionRecord& b) {
                if (a.created_at != b.created_at) return a.created_at > b.created_at;
                return a.id > b.id;
              });
    return rows;
  }

  TransactionSummary summarize(core::AccountId account_id) override {
    store_.checkFault(FaultPoint::READ_TRANSACTION);
    TransactionSummary summary;
    auto it = tables_.transactions_by_account.find(account_id);
    if (it == tables_.transactions_by_account.end()) return summary;

    for (core::TransactionId id : it->second) {
      const auto& row = tables_.transactions.at(id);
      summary.count += 1;
      if (row.status == core::TransactionStatus::COMPLETED) {
        summary.completed_sum += row.amount;
      }
    }
    return summary;
  }

 private:
  void requireWritable() const {
    if (mode_ != AccessMode::READ_WRITE) {
      throw StorageError("write attempted in a read-only unit of work");
    }
  }

  void rollback() {
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
      (*it)();
    }
    undo_.clear();
  }

  MemoryLedgerStore& store_;
  MemoryLedgerStore::Tables& tables_;
  AccessMode mode_;
  bool committed_;
  std::unique_lock<std::shared_timed_mutex> exclusive_;
  std::shared_lock<std::shared_timed_mutex> shared_;
  std::vector<std::function<void()>> undo_;
};

MemoryLedgerStore::MemoryLedgerStore(std::chrono::milliseconds lock_timeout, Clock clock)
    : lock_timeout_(lock_timeout), clock_(std::move(clock)) {
}

std::unique_ptr<UnitOfWork> MemoryLedgerStore::begin(AccessMode mode) {
  if (closed_) {
    throw StorageError("store is closed");
  }
  return std::make_unique<MemoryUnitOfWork>(*this, mode);
}

void MemoryLedgerStore::close() {
  closed_ = true;
}

void MemoryLedgerStore::injectFault(FaultPoint point, int occurrences, int skip) {
  std::lock_guard<std::mutex> lock(fault_mutex_);
  armed_faults_[point] = ArmedFault{skip, occurrences};
}

void MemoryLedgerStore::clearFaults() {
  std::lock_guard<std::mutex> lock(fault_mutex_);
  armed_faults_.clear();
}

void MemoryLedgerStore::checkFault(FaultPoint point) {
  std::lock_guard<std::mutex> lock(fault_mutex_);
  auto it = armed_faults_.find(point);
  if (it == armed_faults_.end()) return;

  ArmedFault& fault = it->second;
  if (fault.skip > 0) {
    --fault.skip;
    return;
  }
  if (--fault.remaining <= 0) {
    armed_faults_.erase(it);
  }
  throw StorageError("injected storage fault");
}

core::Timestamp MemoryLedgerStore::now() {
  core::Timestamp value;
  if (clock_) {
    value = clock_();
  } else {
    value = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
  }
  // Wall clock may step backwards; created_at must not.
  value = std::max(value, last_timestamp_);
  last_timestamp_ = value;
  return value;
}

}  // namespace storage
}  // namespace ledger
