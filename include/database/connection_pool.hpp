#ifndef CONNECTION_POOL_HPP_
#define CONNECTION_POOL_HPP_

#include "database/postgres_connection.hpp"
#include "observability/metrics.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace ledger {
namespace database {

/**
 * Bounded pool of PostgreSQL connections. Each unit of work leases one
 * connection for its whole life so that BEGIN..COMMIT runs on a single session.
 */
class ConnectionPool {
 public:
  class Lease;

  ConnectionPool(const PostgresConnection::Config& config,
                 size_t max_connections,
                 std::chrono::milliseconds acquire_timeout,
                 observability::MetricsCollector& metrics = observability::getGlobalMetrics());
  ~ConnectionPool();

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Opens one connection eagerly so configuration errors surface at startup.
   */
  bool open();

  /**
   * Disconnects idle connections and refuses further leases.
   */
  void close();

  /**
   * Waits up to the acquire timeout for a connection. Throws StorageError on
   * timeout, when closed, or when a new connection cannot be established.
   */
  Lease acquire();

  size_t inUse() const;

  /**
   * Exclusive use of one connection; returns it to the pool on destruction.
   */
  class Lease {
   public:
    Lease(ConnectionPool* pool, std::unique_ptr<PostgresConnection> conn);
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&&) = delete;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    PostgresConnection& operator*() const { return *conn_; }
    PostgresConnection* operator->() const { return conn_.get(); }

   private:
    ConnectionPool* pool_;
    std::unique_ptr<PostgresConnection> conn_;
  };

 private:
  void release(std::unique_ptr<PostgresConnection> conn);

  PostgresConnection::Config config_;
  size_t max_connections_;
  std::chrono::milliseconds acquire_timeout_;
  observability::MetricsCollector& metrics_;

  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::vector<std::unique_ptr<PostgresConnection>> idle_;
  size_t leased_;
  bool closed_;
};

}  // namespace database
}  // namespace ledger

#endif  // CONNECTION_POOL_HPP_
