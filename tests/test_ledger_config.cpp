#include "ledger_config.hpp"

#include <gtest/gtest.h>

#include <map>

using namespace ledger;

namespace {

LedgerConfig::Lookup lookupFrom(const std::map<std::string, std::string>& vars) {
  return [vars](const std::string& name) -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}

}  // namespace

TEST(LedgerConfigTest, Defaults) {
  LedgerConfig config = LedgerConfig::load(lookupFrom({}));
  EXPECT_EQ(config.daily_transfer_limit, Money::parse("200000"));
  EXPECT_FALSE(config.usesDatabase());
  EXPECT_EQ(config.db_pool_size, 8u);
  EXPECT_EQ(config.seed_csv, "accounts.csv");
  EXPECT_FALSE(config.schema_path.empty());
  EXPECT_EQ(config.log_level, observability::LogLevel::INFO);
}

TEST(LedgerConfigTest, ReadsEveryVariable) {
  LedgerConfig config = LedgerConfig::load(lookupFrom({
      {"DAILY_TRANSFER_LIMIT", "1000.50"},
      {"DATABASE_URL", "postgresql://ledger@localhost/ledger"},
      {"LEDGER_DB_POOL_SIZE", "3"},
      {"LEDGER_SCHEMA_PATH", "/etc/ledger/schema.sql"},
      {"LEDGER_SEED_CSV", "/data/accounts.csv"},
      {"LEDGER_LOG_LEVEL", "debug"},
  }));
  EXPECT_EQ(config.daily_transfer_limit, Money::parse("1000.50"));
  EXPECT_TRUE(config.usesDatabase());
  EXPECT_EQ(config.database_url, "postgresql://ledger@localhost/ledger");
  EXPECT_EQ(config.db_pool_size, 3u);
  EXPECT_EQ(config.schema_path, "/etc/ledger/schema.sql");
  EXPECT_EQ(config.seed_csv, "/data/accounts.csv");
  EXPECT_EQ(config.log_level, observability::LogLevel::DEBUG);
}

TEST(LedgerConfigTest, RejectsInvalidLimit) {
  EXPECT_THROW(LedgerConfig::load(lookupFrom({{"DAILY_TRANSFER_LIMIT", "0"}})), ConfigError);
  EXPECT_THROW(LedgerConfig::load(lookupFrom({{"DAILY_TRANSFER_LIMIT", "-5"}})), ConfigError);
  EXPECT_THROW(LedgerConfig::load(lookupFrom({{"DAILY_TRANSFER_LIMIT", "lots"}})), ConfigError);
  EXPECT_THROW(LedgerConfig::load(lookupFrom({{"DAILY_TRANSFER_LIMIT", "1.001"}})), ConfigError);
}

TEST(LedgerConfigTest, ErrorNamesTheVariable) {
  try {
    LedgerConfig::load(lookupFrom({{"LEDGER_DB_POOL_SIZE", "zero"}}));
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("LEDGER_DB_POOL_SIZE"), std::string::npos);
  }
}

TEST(LedgerConfigTest, RejectsInvalidPoolSizeAndLogLevel) {
  EXPECT_THROW(LedgerConfig::load(lookupFrom({{"LEDGER_DB_POOL_SIZE", "0"}})), ConfigError);
  EXPECT_THROW(LedgerConfig::load(lookupFrom({{"LEDGER_DB_POOL_SIZE", "-1"}})), ConfigError);
  EXPECT_THROW(LedgerConfig::load(lookupFrom({{"LEDGER_DB_POOL_SIZE", "4x"}})), ConfigError);
  EXPECT_THROW(LedgerConfig::load(lookupFrom({{"LEDGER_LOG_LEVEL", "chatty"}})), ConfigError);
}
