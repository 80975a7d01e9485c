#include "database/postgres_connection.hpp"

#include "ledger_store.hpp"
#include "observability/logger.hpp"

#include <sstream>

namespace ledger {
namespace database {

std::string sqlState(const PGresult* result) {
  if (!result) return "";
  const char* state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
  return state ? state : "";
}

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
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

bool PostgresConnection::connect() {
  {
    std::lock_guard<std::mutex> lock(mutex_);

    disconnectLocked();
    connection_ = PQconnectdb(buildConnectionString().c_str());

    if (PQstatus(connection_) != CONNECTION_OK) {
      last_error_ = connection_ ? PQerrorMessage(connection_) : "out of memory";
      LEDGER_LOG_BUILDER(observability::LogLevel::ERROR, "Database connection failed")
          .field("target", getConnectionInfo())
          .field("error", last_error_);
      disconnectLocked();
      return false;
    }
    last_error_.clear();
  }

  // Timestamps are stored and compared as UTC wall-clock values.
  if (!executeQuery("SET TIME ZONE 'UTC'; SET DateStyle = 'ISO, YMD';")) {
    disconnect();
    return false;
  }

  LEDGER_LOG_BUILDER(observability::LogLevel::DEBUG, "Connected to PostgreSQL")
      .field("target", getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (connection_) {
    PQfinish(connection_);
    connection_ = nullptr;
  }
  in_transaction_ = false;
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::executeQuery(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) return false;

  PgResult result(PQexec(connection_, query.c_str()));
  if (!result) {
    LEDGER_LOG_ERROR("Query execution failed: connection lost");
    return false;
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
    LEDGER_LOG_BUILDER(observability::LogLevel::ERROR, "Query failed")
        .field("error", PQresultErrorMessage(result.get()));
    return false;
  }
  return true;
}

PgResult PostgresConnection::execute(const std::string& query,
                                     const std::vector<std::string>& params,
                                     std::string* sql_state) {
  std::lock_guard<std::mutex> lock(mutex_);
  return executeLocked(query, params, sql_state);
}

PgResult PostgresConnection::executeLocked(const std::string& query,
                                           const std::vector<std::string>& params,
                                           std::string* sql_state) {
  if (!connection_) {
    throw StoreError("not connected to database");
  }

  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param.c_str());
  }

  PgResult result(PQexecParams(connection_, query.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0));
  if (!result) {
    throw StoreError(std::string("query execution failed: ") + PQerrorMessage(connection_));
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    if (sql_state) {
      *sql_state = sqlState(result.get());
    }
    throw StoreError(std::string("query failed: ") + PQresultErrorMessage(result.get()));
  }
  return result;
}

void PostgresConnection::beginTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_transaction_) {
    throw StoreError("transaction already in progress");
  }
  executeLocked("BEGIN", {}, nullptr);
  in_transaction_ = true;
}

void PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!in_transaction_) {
    throw StoreError("no transaction in progress");
  }
  // A failed COMMIT ends the transaction server-side as well.
  in_transaction_ = false;
  executeLocked("COMMIT", {}, nullptr);
}

void PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!in_transaction_) {
    return;
  }
  in_transaction_ = false;
  executeLocked("ROLLBACK", {}, nullptr);
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction_;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    return last_error_.empty() ? "Not connected" : last_error_;
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

TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  conn_.beginTransaction();
}

TransactionGuard::~TransactionGuard() {
  if (!finished_) {
    try {
      conn_.rollbackTransaction();
    } catch (const StoreError& e) {
      LEDGER_LOG_BUILDER(observability::LogLevel::ERROR, "Rollback failed")
          .field("error", e.what());
    }
  }
}

void TransactionGuard::commit() {
  finished_ = true;
  conn_.commitTransaction();
}

}  // namespace database
}  // namespace ledger
