#ifndef LEDGER_DATABASE_CONNECTION_POOL_HPP_
#define LEDGER_DATABASE_CONNECTION_POOL_HPP_

#include "database/postgres_connection.hpp"
#include "observability/metrics.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace ledger {
namespace database {

/**
 * Fixed-size pool of PostgreSQL connections.
 * acquire() blocks until a connection is free; the returned Lease gives the
 * connection back when it goes out of scope, rolling back a transaction its
 * holder left open. The number of idle connections is published as the
 * kDbPoolAvailable gauge.
 */
class ConnectionPool {
 public:
  class Lease {
   public:
    Lease(ConnectionPool* pool, PostgresConnection* connection)
        : pool_(pool), connection_(connection) {}
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    PostgresConnection& operator*() const { return *connection_; }
    PostgresConnection* operator->() const { return connection_; }

   private:
    void release();

    ConnectionPool* pool_;
    PostgresConnection* connection_;
  };

  ConnectionPool(const PostgresConnection::Config& config, size_t size,
                 observability::MetricsCollector& metrics = observability::getGlobalMetrics());

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Opens every connection. False if any of them fails.
   */
  bool initialize();

  /**
   * Blocks until a connection is free. A connection that dropped since its
   * last use is reconnected first; throws StoreError if that fails.
   */
  Lease acquire();

  size_t size() const { return connections_.size(); }
  size_t available() const;

 private:
  void giveBack(PostgresConnection* connection);

  // Caller holds mutex_.
  void publishAvailableLocked();

  std::vector<std::unique_ptr<PostgresConnection>> connections_;
  std::vector<PostgresConnection*> idle_;
  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
  observability::MetricsCollector& metrics_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_DATABASE_CONNECTION_POOL_HPP_
