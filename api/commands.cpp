#include "api/commands.hpp"

#include "observability/logger.hpp"
#include "seed/csv_seeder.hpp"

#include <sstream>
#include <stdexcept>

namespace ledger {
namespace api {

namespace {

const char* const kUsageStatus = "USAGE";

bool parseInt64(const std::string& text, int64_t& out) {
  if (text.empty()) return false;
  try {
    size_t consumed = 0;
    out = std::stoll(text, &consumed);
    return consumed == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

bool parseAccountId(const std::string& text, AccountId& out) {
  return parseInt64(text, out) && out > 0;
}

Response usageError(const std::string& message) {
  return Response::error(kUsageStatus, message);
}

Response handleCreate(const std::vector<std::string>& args, CommandContext& context) {
  if (args.size() < 3 || args.size() > 7) {
    return usageError("create <customer_id> <account_number> [type] [initial_balance] "
                      "[currency] [customer_name]");
  }

  NewAccount request;
  if (!parseInt64(args[1], request.customer_id)) {
    return usageError("customer_id must be an integer, got '" + args[1] + "'");
  }
  request.account_number = args[2];
  if (args.size() > 3) request.account_type = args[3];
  if (args.size() > 4) {
    std::optional<Money> balance = Money::tryParse(args[4]);
    if (!balance) {
      return usageError("initial_balance must be a decimal with at most 2 fractional digits");
    }
    request.initial_balance = *balance;
  }
  if (args.size() > 5) request.currency = args[5];
  if (args.size() > 6) request.customer_name = args[6];

  try {
    return Response::accountCreated(context.accounts.createAccount(request));
  } catch (const std::invalid_argument& e) {
    return Response::error("INVALID_REQUEST", e.what());
  } catch (const StoreError& e) {
    return Response::error("ERROR", e.what());
  }
}

Response handleGet(const std::vector<std::string>& args, CommandContext& context) {
  AccountId account_id = 0;
  if (args.size() != 2 || !parseAccountId(args[1], account_id)) {
    return usageError("get <account_id>");
  }
  std::optional<Account> account = context.accounts.getAccount(account_id);
  if (!account) {
    return Response::error("NOT_FOUND", "account not found");
  }
  return Response::accountDetails(*account);
}

Response handleStatus(const std::vector<std::string>& args, CommandContext& context) {
  AccountId account_id = 0;
  if (args.size() != 3 || !parseAccountId(args[1], account_id)) {
    return usageError("status <account_id> <ACTIVE|FROZEN|CLOSED>");
  }
  AccountStatus applied = AccountStatus::ACTIVE;
  StatusChange change = context.accounts.changeStatus(account_id, args[2], &applied);
  return Response::statusChanged(account_id, change, applied);
}

Response handleTransfer(const std::vector<std::string>& args, CommandContext& context) {
  AccountId from = 0;
  AccountId to = 0;
  if (args.size() != 4 || !parseAccountId(args[1], from) || !parseAccountId(args[2], to)) {
    return usageError("transfer <from_account_id> <to_account_id> <amount>");
  }
  std::optional<Money> amount = Money::tryParse(args[3]);
  if (!amount) {
    return Response::error("INVALID_REQUEST",
                           "amount must be a decimal with at most 2 fractional digits");
  }
  return Response::transfer(context.engine.transfer(from, to, *amount));
}

Response handleHistory(const std::vector<std::string>& args, CommandContext& context) {
  AccountId account_id = 0;
  int64_t limit = 100;
  if (args.size() < 2 || args.size() > 3 || !parseAccountId(args[1], account_id) ||
      (args.size() == 3 && (!parseInt64(args[2], limit) || limit <= 0))) {
    return usageError("history <account_id> [limit]");
  }
  if (!context.accounts.getAccount(account_id)) {
    return Response::error("NOT_FOUND", "account not found");
  }
  return Response::history(account_id,
                           context.accounts.history(account_id, static_cast<size_t>(limit)));
}

Response handleSeed(const std::vector<std::string>& args, CommandContext& context) {
  if (args.size() != 2) {
    return usageError("seed <csv_path>");
  }
  seed::CsvSeeder seeder(context.store);
  return Response::seeded(seeder.seedFromFile(args[1]));
}

}  // namespace

std::string usage() {
  std::ostringstream out;
  out << "usage: ledger_cli <command> [args]\n"
      << "  health\n"
      << "  create <customer_id> <account_number> [type] [initial_balance] [currency] "
         "[customer_name]\n"
      << "  get <account_id>\n"
      << "  status <account_id> <ACTIVE|FROZEN|CLOSED>\n"
      << "  transfer <from_account_id> <to_account_id> <amount>\n"
      << "  history <account_id> [limit]\n"
      << "  seed <csv_path>\n"
      << "  metrics\n";
  return out.str();
}

Response runCommand(const std::vector<std::string>& args, CommandContext& context) {
  if (args.empty()) {
    return usageError("missing command");
  }

  const std::string& command = args[0];
  try {
    if (command == "health") return Response::health(context.store.ping());
    if (command == "create") return handleCreate(args, context);
    if (command == "get") return handleGet(args, context);
    if (command == "status") return handleStatus(args, context);
    if (command == "transfer") return handleTransfer(args, context);
    if (command == "history") return handleHistory(args, context);
    if (command == "seed") return handleSeed(args, context);
    if (command == "metrics") return Response::metrics(context.metrics.exportMetrics());
  } catch (const StoreError& e) {
    LEDGER_LOG_BUILDER(observability::LogLevel::ERROR, "Command failed")
        .field("command", command)
        .field("error", e.what());
    return Response::error("ERROR", e.what());
  }

  return usageError("unknown command '" + command + "'");
}

int exitCodeFor(const Response& response) {
  if (response.ok()) return 0;
  if (response.status == kUsageStatus) return 2;
  return 1;
}

}  // namespace api
}  // namespace ledger
