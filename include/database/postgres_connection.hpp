#ifndef LEDGER_DATABASE_POSTGRES_CONNECTION_HPP_
#define LEDGER_DATABASE_POSTGRES_CONNECTION_HPP_

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <postgresql/libpq-fe.h>

namespace ledger {
namespace database {

/**
 * Owning handle for a PGresult.
 */
struct PGresultDeleter {
  void operator()(PGresult* result) const { PQclear(result); }
};
using PgResult = std::unique_ptr<PGresult, PGresultDeleter>;

/**
 * SQLSTATE of a failed statement, e.g. "23505" for a unique violation.
 * Empty when libpq did not report one.
 */
std::string sqlState(const PGresult* result);

/**
 * PostgreSQL database connection wrapper.
 * Handles connection management, parameterized queries and transaction
 * control. One connection serves one unit of work at a time; the
 * ConnectionPool hands connections out exclusively.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration. A non-empty `conninfo` (a libpq keyword string
   * or postgresql:// URI) takes precedence over the discrete fields.
   */
  struct Config {
    std::string conninfo;
    std::string host = "localhost";
    int port = 5432;
    std::string database = "ledger";
    std::string username = "ledger";
    std::string password = "";
    int connection_timeout = 30;  // seconds
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database and pin the session to UTC.
   */
  bool connect();

  void disconnect();

  bool isConnected() const;

  /**
   * Execute one or more statements that don't return results.
   * Failures are logged and reported as false.
   */
  bool executeQuery(const std::string& query);

  /**
   * Execute a parameterized statement. Throws StoreError on failure; the
   * message carries the server's error text and `sql_state` receives its
   * SQLSTATE when the caller asks for it.
   */
  PgResult execute(const std::string& query, const std::vector<std::string>& params = {},
                   std::string* sql_state = nullptr);

  // Transaction control; each throws StoreError on failure.
  void beginTransaction();
  void commitTransaction();
  void rollbackTransaction();

  bool inTransaction() const;

  /**
   * libpq's message for the last failure, kept after a failed connect()
   * has torn the connection down.
   */
  std::string getLastError() const;

  /**
   * Get connection info for logging (never includes the password).
   */
  std::string getConnectionInfo() const;

 private:
  std::string buildConnectionString() const;
  void disconnectLocked();
  PgResult executeLocked(const std::string& query, const std::vector<std::string>& params,
                         std::string* sql_state);

  Config config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
  std::string last_error_;
};

/**
 * RAII wrapper for database transactions: rolls back unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  void commit();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_DATABASE_POSTGRES_CONNECTION_HPP_
