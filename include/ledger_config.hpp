#ifndef LEDGER_CONFIG_HPP_
#define LEDGER_CONFIG_HPP_

#include "money.hpp"
#include "observability/logger.hpp"

#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

#ifndef LEDGER_DEFAULT_SCHEMA_PATH
#define LEDGER_DEFAULT_SCHEMA_PATH "database/schema.sql"
#endif

namespace ledger {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Process-wide settings, read once at start-up and then passed around by
 * value. Environment variables:
 *
 *   DAILY_TRANSFER_LIMIT   decimal, default 200000
 *   DATABASE_URL           libpq URI or conninfo; empty selects the in-memory store
 *   LEDGER_DB_POOL_SIZE    default 8
 *   LEDGER_SCHEMA_PATH     DDL applied on start-up
 *   LEDGER_SEED_CSV        default accounts.csv
 *   LEDGER_LOG_LEVEL       DEBUG, INFO, WARN, ERROR or FATAL
 */
struct LedgerConfig {
  Money daily_transfer_limit = Money::fromUnits(200000);
  std::string database_url;
  size_t db_pool_size = 8;
  std::string schema_path = LEDGER_DEFAULT_SCHEMA_PATH;
  std::string seed_csv = "accounts.csv";
  observability::LogLevel log_level = observability::LogLevel::INFO;

  bool usesDatabase() const { return !database_url.empty(); }

  using Lookup = std::function<std::optional<std::string>(const std::string&)>;

  /**
   * Builds a config from `lookup`, which returns the value of a variable or
   * nullopt when unset. Throws ConfigError naming the offending variable.
   */
  static LedgerConfig load(const Lookup& lookup);

  static LedgerConfig fromEnvironment();
};

}  // namespace ledger

#endif  // LEDGER_CONFIG_HPP_
