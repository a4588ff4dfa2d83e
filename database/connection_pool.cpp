#include "database/connection_pool.hpp"
#include "observability/logger.hpp"

namespace ledger {
namespace database {

ConnectionPool::ConnectionPool(const PostgresConnection::Config& config,
                               size_t max_connections,
                               std::chrono::milliseconds acquire_timeout,
                               observability::MetricsCollector& metrics)
    : config_(config),
      max_connections_(max_connections > 0 ? max_connections : 1),
      acquire_timeout_(acquire_timeout),
      metrics_(metrics),
      leased_(0),
      closed_(true) {
}

ConnectionPool::~ConnectionPool() {
  close();
}

bool ConnectionPool::open() {
  auto conn = std::make_unique<PostgresConnection>(config_);
  if (!conn->connect()) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  idle_.push_back(std::move(conn));
  closed_ = false;

  LOG_BUILDER(observability::LogLevel::INFO, "Connection pool opened", "connection_pool")
      .field("max_connections", static_cast<long long>(max_connections_));
  return true;
}

void ConnectionPool::close() {
  std::vector<std::unique_ptr<PostgresConnection>> to_close;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ && idle_.empty()) return;
    closed_ = true;
    to_close.swap(idle_);
  }
  available_.notify_all();

  for (auto& conn : to_close) {
    conn->disconnect();
  }
}

ConnectionPool::Lease ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);

  bool ready = available_.wait_for(lock, acquire_timeout_, [this]() {
    return closed_ || !idle_.empty() || leased_ < max_connections_;
  });

  if (closed_) {
    throw storage::StorageError("connection pool is closed");
  }
  if (!ready) {
    throw storage::StorageError("lock timeout: no database connection available");
  }

  std::unique_ptr<PostgresConnection> conn;
  if (!idle_.empty()) {
    conn = std::move(idle_.back());
    idle_.pop_back();
  }
  ++leased_;
  metrics_.setGauge(observability::kPoolConnectionsInUse, static_cast<double>(leased_));
  lock.unlock();

  // Connect outside the pool lock; a broken idle connection is replaced.
  if (!conn) {
    conn = std::make_unique<PostgresConnection>(config_);
  }
  if (!conn->isConnected() && !conn->connect()) {
    std::lock_guard<std::mutex> relock(mutex_);
    --leased_;
    metrics_.setGauge(observability::kPoolConnectionsInUse, static_cast<double>(leased_));
    available_.notify_one();
    throw storage::StorageError("could not connect to database");
  }

  return Lease(this, std::move(conn));
}

size_t ConnectionPool::inUse() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return leased_;
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> conn) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --leased_;
    metrics_.setGauge(observability::kPoolConnectionsInUse, static_cast<double>(leased_));
    // A connection still inside a transaction cannot be reused.
    if (!closed_ && conn && conn->isConnected() && !conn->inTransaction()) {
      idle_.push_back(std::move(conn));
    }
  }
  available_.notify_one();
}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<PostgresConnection> conn)
    : pool_(pool), conn_(std::move(conn)) {
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), conn_(std::move(other.conn_)) {
  other.pool_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
  if (pool_) {
    pool_->release(std::move(conn_));
  }
}

}  // namespace database
}  // namespace ledger
