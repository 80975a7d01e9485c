#ifndef LEDGER_DATABASE_POSTGRES_LEDGER_STORE_HPP_
#define LEDGER_DATABASE_POSTGRES_LEDGER_STORE_HPP_

#include "database/connection_pool.hpp"
#include "ledger_store.hpp"

#include <memory>
#include <string>

namespace ledger {
namespace database {

/**
 * LedgerStore backed by PostgreSQL.
 *
 * Every unit borrows one pooled connection for its whole lifetime and runs a
 * single database transaction on it; getForUpdate maps to SELECT ... FOR
 * UPDATE, so row locks are PostgreSQL's own and are released by COMMIT or
 * ROLLBACK.
 */
class PostgresLedgerStore : public LedgerStore {
 public:
  struct Config {
    PostgresConnection::Config connection;
    size_t pool_size = 8;
    std::string schema_path;  // empty: schema is assumed to exist
  };

  explicit PostgresLedgerStore(const Config& config);
  ~PostgresLedgerStore() override;

  // Non-copyable
  PostgresLedgerStore(const PostgresLedgerStore&) = delete;
  PostgresLedgerStore& operator=(const PostgresLedgerStore&) = delete;

  /**
   * Opens the pool and applies the schema file.
   */
  bool initialize();

  std::unique_ptr<Unit> begin() override;

  Account createAccount(const NewAccount& request) override;
  void insertAccount(const Account& account) override;
  std::optional<Account> findAccount(AccountId account_id) override;
  std::vector<TransactionRecord> transactionsFor(AccountId account_id,
                                                 size_t limit = 100) override;
  size_t accountCount() override;
  bool ping() override;

 private:
  class PostgresUnit;

  /**
   * Helper to execute schema creation from file.
   */
  bool executeSchemaFile(const std::string& schema_path);

  Config config_;
  std::unique_ptr<ConnectionPool> pool_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_DATABASE_POSTGRES_LEDGER_STORE_HPP_
