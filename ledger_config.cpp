#include "ledger_config.hpp"

#include <cstdlib>

namespace ledger {

namespace {

size_t parsePositiveSize(const std::string& name, const std::string& value) {
  size_t consumed = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError(name + " must be a positive integer, got '" + value + "'");
  }
  if (consumed != value.size() || parsed == 0 || value[0] == '-') {
    throw ConfigError(name + " must be a positive integer, got '" + value + "'");
  }
  return static_cast<size_t>(parsed);
}

}  // namespace

LedgerConfig LedgerConfig::load(const Lookup& lookup) {
  LedgerConfig config;

  if (auto limit = lookup("DAILY_TRANSFER_LIMIT")) {
    std::optional<Money> parsed = Money::tryParse(*limit);
    if (!parsed || !parsed->isPositive()) {
      throw ConfigError("DAILY_TRANSFER_LIMIT must be a positive amount with at most 2 "
                        "fractional digits, got '" + *limit + "'");
    }
    config.daily_transfer_limit = *parsed;
  }

  if (auto url = lookup("DATABASE_URL")) {
    config.database_url = *url;
  }

  if (auto pool_size = lookup("LEDGER_DB_POOL_SIZE")) {
    config.db_pool_size = parsePositiveSize("LEDGER_DB_POOL_SIZE", *pool_size);
  }

  if (auto schema_path = lookup("LEDGER_SCHEMA_PATH")) {
    config.schema_path = *schema_path;
  }

  if (auto seed_csv = lookup("LEDGER_SEED_CSV")) {
    config.seed_csv = *seed_csv;
  }

  if (auto level = lookup("LEDGER_LOG_LEVEL")) {
    std::optional<observability::LogLevel> parsed = observability::parseLogLevel(*level);
    if (!parsed) {
      throw ConfigError("LEDGER_LOG_LEVEL must be one of DEBUG, INFO, WARN, ERROR, FATAL, got '" +
                        *level + "'");
    }
    config.log_level = *parsed;
  }

  return config;
}

LedgerConfig LedgerConfig::fromEnvironment() {
  return load([](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (!value || *value == '\0') {
      return std::nullopt;
    }
    return std::string(value);
  });
}

}  // namespace ledger
