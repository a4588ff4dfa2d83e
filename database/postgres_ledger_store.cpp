#include "database/postgres_ledger_store.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ledger {
namespace database {

namespace {

const char* const kAccountColumns = R"(
  id, account_number, user_id, account_type, balance, status,
  (EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_at_us
)";

const char* const kTransactionColumns = R"(
  id, account_id, type, amount, description, status,
  (EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_at_us,
  COALESCE((EXTRACT(EPOCH FROM processed_at) * 1000000)::BIGINT, 0) AS processed_at_us
)";

core::Account readAccount(const PgResult& result, int row) {
  core::Account account;
  account.id = result.int64(row, 0);
  account.account_number = result.text(row, 1);
  account.owner_id = result.int64(row, 2);

  auto type = core::parseAccountType(result.text(row, 3));
  auto status = core::parseAccountStatus(result.text(row, 5));
  if (!type || !status) {
    throw storage::StorageError("unrecognized account row " + std::to_string(account.id));
  }
  account.type = *type;
  account.balance = result.int64(row, 4);
  account.status = *status;
  account.created_at = result.int64(row, 6);
  return account;
}

core::TransactionRecord readTransaction(const PgResult& result, int row) {
  core::TransactionRecord tx;
  tx.id = result.int64(row, 0);
  tx.account_id = result.int64(row, 1);

  auto type = core::parseTransactionType(result.text(row, 2));
  auto status = core::parseTransactionStatus(result.text(row, 5));
  if (!type || !status) {
    throw storage::StorageError("unrecognized transaction row " + std::to_string(tx.id));
  }
  tx.type = *type;
  tx.amount = result.int64(row, 3);
  tx.description = result.text(row, 4);
  tx.status = *status;
  tx.created_at = result.int64(row, 6);
  tx.processed_at = result.int64(row, 7);
  return tx;
}

class PostgresUnitOfWork : public storage::UnitOfWork,
                           public storage::AccountStore,
                           public storage::TransactionLog {
 public:
  PostgresUnitOfWork(ConnectionPool::Lease lease, storage::AccessMode mode,
                     std::chrono::milliseconds lock_timeout)
      : lease_(std::move(lease)), guard_(*lease_), mode_(mode) {
    if (mode_ == storage::AccessMode::READ_ONLY) {
      // One snapshot for the ownership check and the history read.
      execute("SET TRANSACTION ISOLATION LEVEL REPEATABLE READ, READ ONLY");
    }
    execute("SET LOCAL lock_timeout = '" + std::to_string(lock_timeout.count()) + "ms'");
  }

  storage::AccountStore& accounts() override { return *this; }
  storage::TransactionLog& transactions() override { return *this; }

  void commit() override { guard_.commit(); }

  // AccountStore

  std::optional<core::Account> findById(core::AccountId id, storage::LockMode lock) override {
    std::string query = std::string("SELECT ") + kAccountColumns +
                        " FROM accounts WHERE id = $1";
    if (lock == storage::LockMode::FOR_UPDATE && mode_ == storage::AccessMode::READ_WRITE) {
      query += " FOR UPDATE";
    }

    auto result = lease_->executeParameterizedQuery(query, {std::to_string(id)});
    if (result.rows() == 0) return std::nullopt;
    return readAccount(result, 0);
  }

  std::optional<core::Account> findByOwnerAndType(core::OwnerId owner,
                                                  core::AccountType type) override {
    std::string query = std::string("SELECT ") + kAccountColumns +
                        " FROM accounts WHERE user_id = $1 AND account_type = $2";

    auto result = lease_->executeParameterizedQuery(
        query, {std::to_string(owner), core::toString(type)});
    if (result.rows() == 0) return std::nullopt;
    return readAccount(result, 0);
  }

  std::vector<core::Account> listByOwner(core::OwnerId owner) override {
    std::string query = std::string("SELECT ") + kAccountColumns +
                        " FROM accounts WHERE user_id = $1 ORDER BY id";

    auto result = lease_->executeParameterizedQuery(query, {std::to_string(owner)});
    std::vector<core::Account> accounts;
    for (int i = 0; i < result.rows(); ++i) {
      accounts.push_back(readAccount(result, i));
    }
    return accounts;
  }

  bool accountNumberExists(const std::string& account_number) override {
    auto result = lease_->executeParameterizedQuery(
        "SELECT 1 FROM accounts WHERE account_number = $1", {account_number});
    return result.rows() > 0;
  }

  core::AccountId insert(const storage::NewAccount& account) override {
    std::string query = R"(
      INSERT INTO accounts (account_number, user_id, account_type, balance, status)
      VALUES ($1, $2, $3, 0, 'active')
      RETURNING id
    )";

    try {
      auto result = lease_->executeParameterizedQuery(
          query, {account.account_number, std::to_string(account.owner_id),
                  core::toString(account.type)});
      return result.int64(0, 0);
    } catch (const QueryError& e) {
      if (!e.isUniqueViolation()) throw;
      if (e.constraint() == "accounts_account_number_key") {
        throw storage::DuplicateKeyError(storage::DuplicateKeyError::Key::ACCOUNT_NUMBER,
                                         e.what());
      }
      throw storage::DuplicateKeyError(storage::DuplicateKeyError::Key::OWNER_AND_TYPE, e.what());
    }
  }

  std::optional<core::Money> adjustBalance(core::AccountId id, core::Money delta) override {
    std::string query = R"(
      UPDATE accounts
      SET balance = balance + $2
      WHERE id = $1 AND status = 'active'
      RETURNING balance
    )";

    auto result = lease_->executeParameterizedQuery(
        query, {std::to_string(id), std::to_string(delta)});
    if (result.rows() == 0) return std::nullopt;
    return result.int64(0, 0);
  }

  bool setStatus(core::AccountId id, core::AccountStatus status) override {
    auto result = lease_->executeParameterizedQuery(
        "UPDATE accounts SET status = $2 WHERE id = $1",
        {std::to_string(id), core::toString(status)});
    return result.affectedRows() > 0;
  }

  // TransactionLog

  core::TransactionRecord append(const storage::NewTransaction& transaction) override {
    std::string query = std::string(R"(
      INSERT INTO transactions (account_id, type, amount, description, status, processed_at)
      VALUES ($1, $2, $3, $4, $5, clock_timestamp())
      RETURNING )") + kTransactionColumns;

    auto result = lease_->executeParameterizedQuery(
        query, {std::to_string(transaction.account_id), core::toString(transaction.type),
                std::to_string(transaction.amount), transaction.description,
                core::toString(transaction.status)});
    return readTransaction(result, 0);
  }

  std::optional<core::TransactionRecord> findById(core::TransactionId id) override {
    std::string query = std::string("SELECT ") + kTransactionColumns +
                        " FROM transactions WHERE id = $1";

    auto result = lease_->executeParameterizedQuery(query, {std::to_string(id)});
    if (result.rows() == 0) return std::nullopt;
    return readTransaction(result, 0);
  }

  std::vector<core::TransactionRecord> listForAccount(core::AccountId account_id) override {
    // Served by idx_transactions_account_created.
    std::string query = std::string("SELECT ") + kTransactionColumns + R"(
      FROM transactions
      WHERE account_id = $1
      ORDER BY created_at DESC, id DESC
    )";

    auto result = lease_->executeParameterizedQuery(query, {std::to_string(account_id)});
    std::vector<core::TransactionRecord> transactions;
    transactions.reserve(static_cast<size_t>(result.rows()));
    for (int i = 0; i < result.rows(); ++i) {
      transactions.push_back(readTransaction(result, i));
    }
    return transactions;
  }

  storage::TransactionSummary summarize(core::AccountId account_id) override {
    std::string query = R"(
      SELECT COUNT(*)::BIGINT,
             COALESCE(SUM(amount) FILTER (WHERE status = 'completed'), 0)::BIGINT
      FROM transactions
      WHERE account_id = $1
    )";

    auto result = lease_->executeParameterizedQuery(query, {std::to_string(account_id)});
    storage::TransactionSummary summary;
    summary.count = result.int64(0, 0);
    summary.completed_sum = result.int64(0, 1);
    return summary;
  }

 private:
  void execute(const std::string& statement) {
    if (!lease_->executeQuery(statement)) {
      throw storage::StorageError("statement failed: " + statement);
    }
  }

  // Declaration order matters: the guard rolls back before the lease is returned.
  ConnectionPool::Lease lease_;
  TransactionGuard guard_;
  storage::AccessMode mode_;
};

}  // namespace

PostgresLedgerStore::PostgresLedgerStore(const Config& config)
    : config_(config),
      pool_(config.connection, config.pool_size, config.lock_timeout) {
}

PostgresLedgerStore::~PostgresLedgerStore() {
  close();
}

bool PostgresLedgerStore::open() {
  if (!pool_.open()) {
    LOG_ERROR("Failed to connect to database", "postgres_store");
    return false;
  }
  return true;
}

bool PostgresLedgerStore::initializeSchema(const std::string& schema_path) {
  try {
    if (!executeSchemaFile(schema_path)) {
      LOG_ERROR("Failed to execute schema file " + schema_path, "postgres_store");
      return false;
    }
    LOG_INFO("Database schema initialized", "postgres_store");
    return true;
  } catch (const storage::StorageError& e) {
    LOG_ERROR("Schema initialization failed: " + std::string(e.what()), "postgres_store");
    return false;
  }
}

std::unique_ptr<storage::UnitOfWork> PostgresLedgerStore::begin(storage::AccessMode mode) {
  return std::make_unique<PostgresUnitOfWork>(pool_.acquire(), mode, config_.lock_timeout);
}

void PostgresLedgerStore::close() {
  pool_.close();
}

bool PostgresLedgerStore::executeSchemaFile(const std::string& schema_path) {
  std::ifstream schema_file(schema_path);
  if (!schema_file.is_open()) {
    LOG_ERROR("Could not open schema file: " + schema_path, "postgres_store");
    return false;
  }

  std::stringstream buffer;
  buffer << schema_file.rdbuf();
  std::string schema_sql = buffer.str();

  auto lease = pool_.acquire();

  // Split by semicolon and execute each statement
  size_t pos = 0;
  const std::string delimiter = ";";
  while ((pos = schema_sql.find(delimiter)) != std::string::npos) {
    std::string stmt = schema_sql.substr(0, pos);
    if (std::any_of(stmt.begin(), stmt.end(), ::isalnum)) {
      if (!lease->executeQuery(stmt)) {
        LOG_ERROR("Failed to execute schema statement: " + stmt.substr(0, 100), "postgres_store");
        return false;
      }
    }
    schema_sql.erase(0, pos + delimiter.length());
  }

  return true;
}

}  // namespace database
}  // namespace ledger
