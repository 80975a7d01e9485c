#include "database/connection_pool.hpp"

#include "ledger_store.hpp"
#include "observability/logger.hpp"

#include <stdexcept>

namespace ledger {
namespace database {

ConnectionPool::Lease::~Lease() {
  release();
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(other.connection_) {
  other.pool_ = nullptr;
  other.connection_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    release();
    pool_ = other.pool_;
    connection_ = other.connection_;
    other.pool_ = nullptr;
    other.connection_ = nullptr;
  }
  return *this;
}

void ConnectionPool::Lease::release() {
  if (pool_ && connection_) {
    if (connection_->inTransaction()) {
      try {
        connection_->rollbackTransaction();
      } catch (const StoreError& e) {
        // The next acquire() reconnects.
        LEDGER_LOG_BUILDER(observability::LogLevel::WARN, "Dropping connection after failed rollback")
            .field("error", e.what());
        connection_->disconnect();
      }
    }
    pool_->giveBack(connection_);
  }
  pool_ = nullptr;
  connection_ = nullptr;
}

ConnectionPool::ConnectionPool(const PostgresConnection::Config& config, size_t size,
                               observability::MetricsCollector& metrics)
    : metrics_(metrics) {
  if (size == 0) {
    throw std::invalid_argument("connection pool size must be positive");
  }
  for (size_t i = 0; i < size; ++i) {
    connections_.push_back(std::make_unique<PostgresConnection>(config));
  }
}

bool ConnectionPool::initialize() {
  std::lock_guard<std::mutex> lock(mutex_);
  idle_.clear();
  for (auto& connection : connections_) {
    if (!connection->connect()) {
      return false;
    }
    idle_.push_back(connection.get());
  }
  publishAvailableLocked();

  LEDGER_LOG_BUILDER(observability::LogLevel::INFO, "Connection pool ready")
      .field("connections", static_cast<int64_t>(connections_.size()));
  return true;
}

ConnectionPool::Lease ConnectionPool::acquire() {
  PostgresConnection* connection = nullptr;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    available_cv_.wait(lock, [this] { return !idle_.empty(); });
    connection = idle_.back();
    idle_.pop_back();
    publishAvailableLocked();
  }

  Lease lease(this, connection);
  if (!connection->isConnected() && !connection->connect()) {
    throw StoreError("database connection unavailable: " + connection->getLastError());
  }
  return lease;
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

void ConnectionPool::giveBack(PostgresConnection* connection) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(connection);
    publishAvailableLocked();
  }
  available_cv_.notify_one();
}

void ConnectionPool::publishAvailableLocked() {
  metrics_.setGauge(observability::kDbPoolAvailable, static_cast<double>(idle_.size()));
}

}  // namespace database
}  // namespace ledger
