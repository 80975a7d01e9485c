#include "api/response.hpp"

namespace ledger {
namespace api {

nlohmann::json toJson(const Account& account) {
  nlohmann::json j;
  j["account_id"] = account.account_id;
  j["customer_id"] = account.customer_id;
  j["account_number"] = account.account_number;
  j["account_type"] = account.account_type;
  j["balance"] = account.balance.toString();
  j["currency"] = account.currency;
  j["status"] = toString(account.status);
  j["customer_name"] = account.customer_name;
  j["created_at"] = formatTimestamp(account.created_at);
  return j;
}

nlohmann::json toJson(const TransactionRecord& record) {
  nlohmann::json j;
  j["id"] = record.id;
  j["from_account"] = record.from_account;
  j["to_account"] = record.to_account;
  j["amount"] = record.amount.toString();
  j["created_at"] = formatTimestamp(record.created_at);
  return j;
}

Response Response::success(const std::string& message, const nlohmann::json& payload) {
  Response resp;
  resp.status = "SUCCESS";
  resp.message = message;
  resp.payload = payload;
  return resp;
}

Response Response::error(const std::string& status, const std::string& message) {
  Response resp;
  resp.status = status;
  resp.message = message;
  return resp;
}

Response Response::health(bool store_reachable) {
  if (!store_reachable) {
    return error("UNAVAILABLE", "ledger store unreachable");
  }
  nlohmann::json payload;
  payload["status"] = "ok";
  return success("healthy", payload);
}

Response Response::accountCreated(const Account& account) {
  nlohmann::json payload;
  payload["account_id"] = account.account_id;
  payload["balance"] = account.balance.toString();
  return success("account created", payload);
}

Response Response::accountDetails(const Account& account) {
  return success("account found", toJson(account));
}

Response Response::statusChanged(AccountId account_id, StatusChange change,
                                 AccountStatus applied) {
  switch (change) {
    case StatusChange::OK: {
      nlohmann::json payload;
      payload["account_id"] = account_id;
      payload["status"] = toString(applied);
      return success("status changed", payload);
    }
    case StatusChange::NOT_FOUND:
      return error("NOT_FOUND", "account not found");
    case StatusChange::INVALID_STATUS:
      return error("INVALID_STATUS", "status must be one of ACTIVE, FROZEN, CLOSED");
    case StatusChange::INVALID_TRANSITION:
      return error("INVALID_TRANSITION", "a closed account cannot change status");
  }
  return error("ERROR", "unknown status change outcome");
}

Response Response::transfer(const TransferResult& result) {
  if (!result.ok()) {
    Response resp = error(toString(result.status), result.message);
    if (result.limit_breach) {
      resp.payload["limit"] = result.limit_breach->limit.toString();
      resp.payload["already_transferred_today"] =
          result.limit_breach->transferred_today.toString();
      resp.payload["attempting"] = result.limit_breach->attempted.toString();
    }
    return resp;
  }

  nlohmann::json payload;
  payload["from_account"] = result.receipt->from_account_id;
  payload["to_account"] = result.receipt->to_account_id;
  payload["amount"] = result.receipt->amount.toString();
  payload["transaction_id"] = result.receipt->transaction_id;
  payload["created_at"] = formatTimestamp(result.receipt->created_at);
  return success(result.message, payload);
}

Response Response::history(AccountId account_id, const std::vector<TransactionRecord>& records) {
  nlohmann::json payload;
  payload["account_id"] = account_id;
  payload["transactions"] = nlohmann::json::array();
  for (const auto& record : records) {
    payload["transactions"].push_back(toJson(record));
  }
  return success("transactions retrieved", payload);
}

Response Response::seeded(const seed::SeedReport& report) {
  nlohmann::json payload;
  payload["seeded"] = report.seeded;
  payload["inserted"] = report.inserted;
  payload["skipped"] = report.skipped;
  return success(report.seeded ? "accounts seeded" : "nothing seeded", payload);
}

Response Response::metrics(const std::string& exposition) {
  nlohmann::json payload;
  payload["exposition"] = exposition;
  return success("metrics exported", payload);
}

std::string serializeResponse(const Response& response) {
  nlohmann::json j;
  j["status"] = response.status;
  j["message"] = response.message;
  j["payload"] = response.payload;
  return j.dump();
}

}  // namespace api
}  // namespace ledger
