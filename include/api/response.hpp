#ifndef LEDGER_API_RESPONSE_HPP_
#define LEDGER_API_RESPONSE_HPP_

#include "account_service.hpp"
#include "seed/csv_seeder.hpp"
#include "transfer_engine.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ledger {
namespace api {

/**
 * Result document for one operation:
 *   {"status": "...", "message": "...", "payload": {...}}
 * Monetary values are rendered as decimal strings, never JSON numbers.
 */
struct Response {
  std::string status;
  std::string message;
  nlohmann::json payload = nlohmann::json::object();

  bool ok() const { return status == "SUCCESS"; }

  static Response success(const std::string& message,
                          const nlohmann::json& payload = nlohmann::json::object());
  static Response error(const std::string& status, const std::string& message);

  static Response health(bool store_reachable);
  static Response accountCreated(const Account& account);
  static Response accountDetails(const Account& account);
  static Response statusChanged(AccountId account_id, StatusChange change,
                                AccountStatus applied);
  static Response transfer(const TransferResult& result);
  static Response history(AccountId account_id, const std::vector<TransactionRecord>& records);
  static Response seeded(const seed::SeedReport& report);
  static Response metrics(const std::string& exposition);
};

nlohmann::json toJson(const Account& account);
nlohmann::json toJson(const TransactionRecord& record);

std::string serializeResponse(const Response& response);

}  // namespace api
}  // namespace ledger

#endif  // LEDGER_API_RESPONSE_HPP_
