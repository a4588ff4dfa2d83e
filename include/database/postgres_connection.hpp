#ifndef POSTGRES_CONNECTION_HPP_
#define POSTGRES_CONNECTION_HPP_

#include "storage/ledger_store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <postgresql/libpq-fe.h>

namespace ledger {
namespace database {

/**
 * A statement the server rejected. Carries the SQLSTATE and, for constraint
 * violations, the constraint name.
 */
class QueryError : public storage::StorageError {
 public:
  QueryError(const std::string& message, std::string sqlstate, std::string constraint)
      : storage::StorageError(message),
        sqlstate_(std::move(sqlstate)),
        constraint_(std::move(constraint)) {}

  const std::string& sqlstate() const { return sqlstate_; }
  const std::string& constraint() const { return constraint_; }

  bool isUniqueViolation() const { return sqlstate_ == "23505"; }
  bool isLockTimeout() const { return sqlstate_ == "55P03"; }

 private:
  std::string sqlstate_;
  std::string constraint_;
};

/**
 * Owning handle for a PGresult.
 */
class PgResult {
 public:
  PgResult() : result_(nullptr, &PQclear) {}
  explicit PgResult(PGresult* result) : result_(result, &PQclear) {}

  int rows() const { return result_ ? PQntuples(result_.get()) : 0; }
  bool isNull(int row, int column) const { return PQgetisnull(result_.get(), row, column) == 1; }
  std::string text(int row, int column) const { return PQgetvalue(result_.get(), row, column); }
  std::int64_t int64(int row, int column) const { return std::stoll(text(row, column)); }

  /**
   * Rows affected by an INSERT/UPDATE/DELETE.
   */
  std::int64_t affectedRows() const;

 private:
  std::unique_ptr<PGresult, decltype(&PQclear)> result_;
};

/**
 * PostgreSQL database connection wrapper.
 * Handles connection management and parameterized query execution.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration
   */
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "ledger";
    std::string username = "ledger_user";
    std::string password = "";
    int connection_timeout = 30;  // seconds
    // Full libpq conninfo string; overrides the fields above when set.
    std::string conninfo;
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database.
   */
  bool connect();

  /**
   * Disconnect from the database.
   */
  void disconnect();

  /**
   * Check if connected.
   */
  bool isConnected() const;

  /**
   * Execute a statement that doesn't return results. Returns false and logs on failure.
   */
  bool executeQuery(const std::string& query);

  /**
   * Execute a parameterized statement. Null entries are sent as SQL NULL.
   * Throws QueryError when the server rejects it.
   */
  PgResult executeParameterizedQuery(const std::string& query,
                                     const std::vector<std::optional<std::string>>& params);

  /**
   * Begin a transaction.
   */
  bool beginTransaction();

  /**
   * Commit a transaction.
   */
  bool commitTransaction();

  /**
   * Rollback a transaction.
   */
  bool rollbackTransaction();

  bool inTransaction() const;

  /**
   * Get last error message.
   */
  std::string getLastError() const;

  /**
   * Get connection info for logging.
   */
  std::string getConnectionInfo() const;

 private:
  bool executeLocked(const std::string& query);
  std::string buildConnectionString() const;

  Config config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction. Throws StorageError if the server refuses.
   */
  void commit();

  /**
   * Rollback the transaction (called automatically in destructor).
   */
  void rollback();

  bool committed() const { return committed_; }

 private:
  PostgresConnection& conn_;
  bool committed_;
  bool finished_;
};

}  // namespace database
}  // namespace ledger

#endif  // POSTGRES_CONNECTION_HPP_
