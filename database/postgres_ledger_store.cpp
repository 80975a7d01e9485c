#include "database/postgres_ledger_store.hpp"

#include "observability/logger.hpp"

#include <fstream>
#include <sstream>

namespace ledger {
namespace database {

namespace {

constexpr const char* kUniqueViolation = "23505";

constexpr const char* kAccountColumns =
    "account_id, customer_id, account_number, account_type, balance, currency, "
    "status, customer_name, created_at";

std::string field(const PGresult* result, int row, int column) {
  return PQgetisnull(result, row, column) ? "" : PQgetvalue(result, row, column);
}

Timestamp timestampField(const PGresult* result, int row, int column) {
  std::string text = field(result, row, column);
  std::optional<Timestamp> ts = parseTimestamp(text);
  if (!ts) {
    throw StoreError("unparseable timestamp from database: " + text);
  }
  return *ts;
}

Money moneyField(const PGresult* result, int row, int column) {
  std::string text = field(result, row, column);
  std::optional<Money> money = Money::tryParse(text);
  if (!money) {
    throw StoreError("unparseable amount from database: " + text);
  }
  return *money;
}

// Column order follows kAccountColumns.
Account accountFromRow(const PGresult* result, int row) {
  Account account;
  account.account_id = std::stoll(field(result, row, 0));
  account.customer_id = std::stoll(field(result, row, 1));
  account.account_number = field(result, row, 2);
  account.account_type = field(result, row, 3);
  account.balance = moneyField(result, row, 4);
  account.currency = field(result, row, 5);

  std::string status = field(result, row, 6);
  std::optional<AccountStatus> parsed = parseAccountStatus(status);
  if (!parsed) {
    throw StoreError("unknown account status in database: " + status);
  }
  account.status = *parsed;

  account.customer_name = PQgetisnull(result, row, 7)
      ? defaultCustomerName(account.customer_id)
      : field(result, row, 7);
  account.created_at = timestampField(result, row, 8);
  return account;
}

TransactionRecord transactionFromRow(const PGresult* result, int row) {
  TransactionRecord record;
  record.id = std::stoll(field(result, row, 0));
  record.from_account = std::stoll(field(result, row, 1));
  record.to_account = std::stoll(field(result, row, 2));
  record.amount = moneyField(result, row, 3);
  record.created_at = timestampField(result, row, 4);
  return record;
}

}  // namespace

/**
 * One database transaction on a leased connection.
 */
class PostgresLedgerStore::PostgresUnit : public LedgerStore::Unit {
 public:
  explicit PostgresUnit(ConnectionPool::Lease lease) : lease_(std::move(lease)) {
    lease_->beginTransaction();
  }

  ~PostgresUnit() override {
    if (open_) {
      try {
        rollback();
      } catch (const StoreError& e) {
        LEDGER_LOG_BUILDER(observability::LogLevel::ERROR, "Rollback of abandoned unit failed")
            .field("error", e.what());
      }
    }
  }

  std::optional<Account> getForUpdate(AccountId account_id) override {
    ensureOpen();
    PgResult result = lease_->execute(
        std::string("SELECT ") + kAccountColumns +
            " FROM accounts WHERE account_id = $1 FOR UPDATE",
        {std::to_string(account_id)});

    if (PQntuples(result.get()) == 0) {
      return std::nullopt;
    }
    return accountFromRow(result.get(), 0);
  }

  void save(const Account& account) override {
    ensureOpen();
    PgResult result = lease_->execute(
        "UPDATE accounts SET balance = $2, status = $3 WHERE account_id = $1",
        {std::to_string(account.account_id), account.balance.toString(),
         toString(account.status)});

    if (std::string(PQcmdTuples(result.get())) != "1") {
      throw StoreError("account " + std::to_string(account.account_id) + " not updated");
    }
  }

  TransactionRecord appendTransaction(const NewTransaction& transaction) override {
    ensureOpen();
    PgResult result = lease_->execute(
        "INSERT INTO transactions (from_account, to_account, amount, created_at) "
        "VALUES ($1, $2, $3, $4::timestamp) "
        "RETURNING id, from_account, to_account, amount, created_at",
        {std::to_string(transaction.from_account), std::to_string(transaction.to_account),
         transaction.amount.toString(), formatTimestamp(transaction.created_at)});

    return transactionFromRow(result.get(), 0);
  }

  Money sumSentSince(AccountId account_id, Timestamp window_start,
                     Timestamp window_end) override {
    ensureOpen();
    PgResult result = lease_->execute(
        "SELECT COALESCE(SUM(amount), 0) FROM transactions "
        "WHERE from_account = $1 AND created_at BETWEEN $2::timestamp AND $3::timestamp",
        {std::to_string(account_id), formatTimestamp(window_start),
         formatTimestamp(window_end)});

    return moneyField(result.get(), 0, 0);
  }

  void commit() override {
    ensureOpen();
    open_ = false;
    lease_->commitTransaction();
  }

  void rollback() override {
    if (!open_) {
      return;
    }
    open_ = false;
    lease_->rollbackTransaction();
  }

 private:
  void ensureOpen() const {
    if (!open_) {
      throw StoreError("unit of work already finished");
    }
  }

  ConnectionPool::Lease lease_;
  bool open_ = true;
};

PostgresLedgerStore::PostgresLedgerStore(const Config& config)
    : config_(config),
      pool_(std::make_unique<ConnectionPool>(config.connection, config.pool_size)) {
}

PostgresLedgerStore::~PostgresLedgerStore() = default;

bool PostgresLedgerStore::initialize() {
  if (!pool_->initialize()) {
    LEDGER_LOG_ERROR("Failed to open database connections");
    return false;
  }

  if (!config_.schema_path.empty() && !executeSchemaFile(config_.schema_path)) {
    LEDGER_LOG_ERROR("Failed to initialize database schema");
    return false;
  }

  LEDGER_LOG_INFO("PostgreSQL ledger store initialized");
  return true;
}

bool PostgresLedgerStore::executeSchemaFile(const std::string& schema_path) {
  std::ifstream file(schema_path);
  if (!file) {
    LEDGER_LOG_BUILDER(observability::LogLevel::ERROR, "Schema file not readable")
        .field("path", schema_path);
    return false;
  }

  std::stringstream ddl;
  ddl << file.rdbuf();

  // The advisory lock keeps concurrently starting processes from racing on DDL.
  auto connection = pool_->acquire();
  if (!connection->executeQuery("SELECT pg_advisory_lock(4242);")) {
    return false;
  }
  bool applied = connection->executeQuery(ddl.str());
  bool unlocked = connection->executeQuery("SELECT pg_advisory_unlock(4242);");
  return applied && unlocked;
}

std::unique_ptr<LedgerStore::Unit> PostgresLedgerStore::begin() {
  return std::make_unique<PostgresUnit>(pool_->acquire());
}

Account PostgresLedgerStore::createAccount(const NewAccount& request) {
  if (request.initial_balance.isNegative()) {
    throw StoreError("initial balance must not be negative");
  }

  auto connection = pool_->acquire();
  std::string sql_state;
  try {
    PgResult result = connection->execute(
        std::string("INSERT INTO accounts (customer_id, account_number, account_type, balance, "
                    "currency, status, customer_name, created_at) "
                    "VALUES ($1, $2, $3, $4, $5, 'ACTIVE', $6, $7::timestamp) RETURNING ") +
            kAccountColumns,
        {std::to_string(request.customer_id), request.account_number, request.account_type,
         request.initial_balance.toString(), request.currency,
         request.customer_name.value_or(defaultCustomerName(request.customer_id)),
         formatTimestamp(nowUtc())},
        &sql_state);
    return accountFromRow(result.get(), 0);
  } catch (const StoreError&) {
    if (sql_state == kUniqueViolation) {
      throw StoreError("account number already exists: " + request.account_number);
    }
    throw;
  }
}

void PostgresLedgerStore::insertAccount(const Account& account) {
  auto connection = pool_->acquire();
  TransactionGuard transaction(*connection);

  std::string sql_state;
  try {
    connection->execute(
        "INSERT INTO accounts (account_id, customer_id, account_number, account_type, balance, "
        "currency, status, customer_name, created_at) "
        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9::timestamp)",
        {std::to_string(account.account_id), std::to_string(account.customer_id),
         account.account_number, account.account_type, account.balance.toString(),
         account.currency, toString(account.status), account.customer_name,
         formatTimestamp(account.created_at)},
        &sql_state);
  } catch (const StoreError&) {
    if (sql_state == kUniqueViolation) {
      throw StoreError("account already exists: " + std::to_string(account.account_id) + " / " +
                       account.account_number);
    }
    throw;
  }

  // Keep the sequence ahead of explicitly chosen ids.
  connection->execute(
      "SELECT setval('account_id_seq', GREATEST((SELECT MAX(account_id) FROM accounts), 1))");
  transaction.commit();
}

std::optional<Account> PostgresLedgerStore::findAccount(AccountId account_id) {
  auto connection = pool_->acquire();
  PgResult result = connection->execute(
      std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE account_id = $1",
      {std::to_string(account_id)});

  if (PQntuples(result.get()) == 0) {
    return std::nullopt;
  }
  return accountFromRow(result.get(), 0);
}

std::vector<TransactionRecord> PostgresLedgerStore::transactionsFor(AccountId account_id,
                                                                    size_t limit) {
  auto connection = pool_->acquire();
  PgResult result = connection->execute(
      "SELECT id, from_account, to_account, amount, created_at FROM transactions "
      "WHERE from_account = $1 OR to_account = $1 ORDER BY id DESC LIMIT $2",
      {std::to_string(account_id), std::to_string(limit)});

  std::vector<TransactionRecord> records;
  int rows = PQntuples(result.get());
  records.reserve(rows);
  for (int row = 0; row < rows; ++row) {
    records.push_back(transactionFromRow(result.get(), row));
  }
  return records;
}

size_t PostgresLedgerStore::accountCount() {
  auto connection = pool_->acquire();
  PgResult result = connection->execute("SELECT COUNT(*) FROM accounts");
  return static_cast<size_t>(std::stoull(field(result.get(), 0, 0)));
}

bool PostgresLedgerStore::ping() {
  try {
    auto connection = pool_->acquire();
    connection->execute("SELECT 1");
    return true;
  } catch (const StoreError& e) {
    LEDGER_LOG_BUILDER(observability::LogLevel::WARN, "Database ping failed")
        .field("error", e.what());
    return false;
  }
}

}  // namespace database
}  // namespace ledger
