#ifndef LEDGER_API_COMMANDS_HPP_
#define LEDGER_API_COMMANDS_HPP_

#include "account_service.hpp"
#include "api/response.hpp"
#include "ledger_store.hpp"
#include "observability/metrics.hpp"
#include "transfer_engine.hpp"

#include <string>
#include <vector>

namespace ledger {
namespace api {

/**
 * Services a command runs against. None of them is owned.
 */
struct CommandContext {
  LedgerStore& store;
  AccountService& accounts;
  TransferEngine& engine;
  observability::MetricsCollector& metrics;
};

/**
 * Runs one command line, e.g. {"transfer", "1", "2", "50.00"}, and returns
 * its result document. Malformed arguments produce a "USAGE" response; the
 * call itself does not throw.
 */
Response runCommand(const std::vector<std::string>& args, CommandContext& context);

/**
 * Process exit status for a response: 0 on success, 2 for usage errors and
 * 1 for every other rejection or failure.
 */
int exitCodeFor(const Response& response);

std::string usage();

}  // namespace api
}  // namespace ledger

#endif  // LEDGER_API_COMMANDS_HPP_
