#ifndef POSTGRES_LEDGER_STORE_HPP_
#define POSTGRES_LEDGER_STORE_HPP_

#include "database/connection_pool.hpp"
#include "storage/ledger_store.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace ledger {
namespace database {

/**
 * LedgerStore backed by PostgreSQL.
 *
 * Every unit of work runs as one server-side transaction on a leased
 * connection. Balance changes are a single relative UPDATE evaluated by the
 * server under its row lock, so concurrent deposits never overwrite each other.
 */
class PostgresLedgerStore : public storage::LedgerStore {
 public:
  struct Config {
    PostgresConnection::Config connection;
    size_t pool_size = 10;
    // Bounds both the wait for a pooled connection and the server's lock_timeout.
    std::chrono::milliseconds lock_timeout{5000};
  };

  explicit PostgresLedgerStore(const Config& config);
  ~PostgresLedgerStore() override;

  // Non-copyable
  PostgresLedgerStore(const PostgresLedgerStore&) = delete;
  PostgresLedgerStore& operator=(const PostgresLedgerStore&) = delete;

  /**
   * Connects the pool. Returns false when the database is unreachable.
   */
  bool open();

  /**
   * Executes the schema file statement by statement. Statements are idempotent.
   */
  bool initializeSchema(const std::string& schema_path);

  std::unique_ptr<storage::UnitOfWork> begin(storage::AccessMode mode) override;

  void close() override;

 private:
  bool executeSchemaFile(const std::string& schema_path);

  Config config_;
  ConnectionPool pool_;
};

}  // namespace database
}  // namespace ledger

#endif  // POSTGRES_LEDGER_STORE_HPP_
