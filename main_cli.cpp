#include "account_service.hpp"
#include "api/commands.hpp"
#include "database/postgres_ledger_store.hpp"
#include "in_memory_ledger_store.hpp"
#include "ledger_config.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"
#include "seed/csv_seeder.hpp"
#include "transfer_engine.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

std::unique_ptr<ledger::LedgerStore> openStore(const ledger::LedgerConfig& config) {
  if (!config.usesDatabase()) {
    LEDGER_LOG_INFO("Using in-memory ledger store");
    return std::make_unique<ledger::InMemoryLedgerStore>();
  }

  ledger::database::PostgresLedgerStore::Config db_config;
  db_config.connection.conninfo = config.database_url;
  db_config.pool_size = config.db_pool_size;
  db_config.schema_path = config.schema_path;

  auto store = std::make_unique<ledger::database::PostgresLedgerStore>(db_config);
  if (!store->initialize()) {
    return nullptr;
  }
  return store;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty() || args[0] == "--help" || args[0] == "-h") {
    std::cerr << ledger::api::usage();
    return args.empty() ? 2 : 0;
  }

  ledger::LedgerConfig config;
  try {
    config = ledger::LedgerConfig::fromEnvironment();
  } catch (const ledger::ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 2;
  }
  ledger::observability::Logger::getInstance().setLogLevel(config.log_level);

  try {
    std::unique_ptr<ledger::LedgerStore> store = openStore(config);
    if (!store) {
      std::cerr << "Failed to initialize ledger store" << std::endl;
      return 1;
    }

    // Start-up seeding; a missing file is not an error.
    if (args[0] != "seed") {
      ledger::seed::CsvSeeder seeder(*store);
      seeder.seedFromFile(config.seed_csv);
    }

    auto& metrics = ledger::observability::getGlobalMetrics();
    ledger::AccountService accounts(*store, metrics);
    ledger::TransferEngine engine(*store, ledger::TransferLimits{config.daily_transfer_limit},
                                  ledger::nowUtc, metrics);
    ledger::api::CommandContext context{*store, accounts, engine, metrics};

    ledger::api::Response response = ledger::api::runCommand(args, context);
    std::cout << ledger::api::serializeResponse(response) << std::endl;
    if (response.status == "USAGE") {
      std::cerr << ledger::api::usage();
    }
    return ledger::api::exitCodeFor(response);
  } catch (const std::exception& e) {
    std::cerr << "Ledger error: " << e.what() << std::endl;
    return 1;
  }
}
