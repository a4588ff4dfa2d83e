#include "database/postgres_connection.hpp"
#include "observability/logger.hpp"

#include <cstring>
#include <sstream>

namespace ledger {
namespace database {

std::int64_t PgResult::affectedRows() const {
  if (!result_) return 0;
  const char* tuples = PQcmdTuples(result_.get());
  if (!tuples || std::strlen(tuples) == 0) return 0;
  return std::stoll(tuples);
}

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    PQfinish(connection_);
    connection_ = nullptr;
  }

  connection_ = PQconnectdb(buildConnectionString().c_str());

  if (PQstatus(connection_) != CONNECTION_OK) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Database connection failed", "postgres")
        .field("error", std::string(PQerrorMessage(connection_)));
    PQfinish(connection_);
    connection_ = nullptr;
    return false;
  }

  // A reported commit must survive a crash.
  if (!executeLocked("SET SESSION synchronous_commit = on")) {
    PQfinish(connection_);
    connection_ = nullptr;
    return false;
  }

  LOG_DEBUG("Connected to PostgreSQL database: " + getConnectionInfo(), "postgres");
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    if (in_transaction_) {
      executeLocked("ROLLBACK");
      in_transaction_ = false;
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::executeQuery(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);
  return executeLocked(query);
}

bool PostgresConnection::executeLocked(const std::string& query) {
  if (!connection_) return false;

  PGresult* result = PQexec(connection_, query.c_str());

  if (!result) {
    LOG_ERROR("Query execution failed: connection lost", "postgres");
    return false;
  }

  ExecStatusType status = PQresultStatus(result);
  bool success = (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);

  // COMMIT of an aborted transaction succeeds with a ROLLBACK tag.
  if (success && query == "COMMIT" && std::strcmp(PQcmdStatus(result), "COMMIT") != 0) {
    success = false;
  }

  if (!success) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Query failed", "postgres")
        .field("error", std::string(PQresultErrorMessage(result)))
        .field("status", std::string(PQcmdStatus(result)));
  }

  PQclear(result);
  return success;
}

PgResult PostgresConnection::executeParameterizedQuery(
    const std::string& query, const std::vector<std::optional<std::string>>& params) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    throw QueryError("not connected", "08003", "");
  }

  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param ? param->c_str() : nullptr);
  }

  PGresult* raw = PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0);

  if (!raw) {
    throw QueryError("Parameterized query execution failed: connection lost", "08006", "");
  }

  ExecStatusType status = PQresultStatus(raw);
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    const char* sqlstate = PQresultErrorField(raw, PG_DIAG_SQLSTATE);
    const char* constraint = PQresultErrorField(raw, PG_DIAG_CONSTRAINT_NAME);
    std::string message = PQresultErrorMessage(raw);
    QueryError error(message, sqlstate ? sqlstate : "", constraint ? constraint : "");
    PQclear(raw);
    throw error;
  }

  return PgResult(raw);
}

bool PostgresConnection::beginTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!executeLocked("BEGIN")) {
    return false;
  }

  in_transaction_ = true;
  return true;
}

bool PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("COMMIT");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("ROLLBACK");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction_;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    return "Not connected";
  }

  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  if (!config_.conninfo.empty()) {
    return "conninfo";
  }
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

std::string PostgresConnection::buildConnectionString() const {
  if (!config_.conninfo.empty()) {
    return config_.conninfo;
  }

  std::stringstream conn_str;
  conn_str << "host=" << config_.host
           << " port=" << config_.port
           << " dbname=" << config_.database
           << " user=" << config_.username
           << " connect_timeout=" << config_.connection_timeout;
  if (!config_.password.empty()) {
    conn_str << " password=" << config_.password;
  }
  return conn_str.str();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), committed_(false), finished_(false) {
  if (!conn_.beginTransaction()) {
    throw storage::StorageError("Failed to begin transaction: " + conn_.getLastError());
  }
}

TransactionGuard::~TransactionGuard() {
  if (!finished_) {
    conn_.rollbackTransaction();
  }
}

void TransactionGuard::commit() {
  if (finished_) return;
  finished_ = true;
  if (!conn_.commitTransaction()) {
    throw storage::StorageError("Failed to commit transaction: " + conn_.getLastError());
  }
  committed_ = true;
}

void TransactionGuard::rollback() {
  if (!finished_) {
    conn_.rollbackTransaction();
    finished_ = true;
  }
}

}  // namespace database
}  // namespace ledger
