#include "account_service.hpp"

#include "observability/logger.hpp"

#include <stdexcept>

namespace ledger {

std::string toString(StatusChange change) {
  switch (change) {
    case StatusChange::OK: return "OK";
    case StatusChange::NOT_FOUND: return "NOT_FOUND";
    case StatusChange::INVALID_STATUS: return "INVALID_STATUS";
    case StatusChange::INVALID_TRANSITION: return "INVALID_TRANSITION";
  }
  return "UNKNOWN";
}

bool isAllowedTransition(AccountStatus from, AccountStatus to) {
  if (from == to) {
    return true;
  }
  return from != AccountStatus::CLOSED;
}

AccountService::AccountService(LedgerStore& store, observability::MetricsCollector& metrics)
    : store_(store), metrics_(metrics) {
}

Account AccountService::createAccount(const NewAccount& request) {
  if (request.account_number.empty()) {
    throw std::invalid_argument("account number must not be empty");
  }
  if (request.initial_balance.isNegative()) {
    throw std::invalid_argument("initial balance must not be negative");
  }

  Account account = store_.createAccount(request);
  metrics_.incrementCounter(observability::kAccountsCreatedTotal);

  LEDGER_LOG_BUILDER(observability::LogLevel::INFO, "Account created")
      .field("account_id", account.account_id)
      .field("customer_id", account.customer_id)
      .field("balance", account.balance);
  return account;
}

std::optional<Account> AccountService::getAccount(AccountId account_id) {
  return store_.findAccount(account_id);
}

StatusChange AccountService::changeStatus(AccountId account_id, const std::string& status,
                                          AccountStatus* applied) {
  std::optional<AccountStatus> target = parseAccountStatus(status);
  if (!target) {
    return StatusChange::INVALID_STATUS;
  }

  // The check and the write happen under the row lock so a concurrent
  // close cannot be undone.
  std::unique_ptr<LedgerStore::Unit> unit = store_.begin();
  std::optional<Account> current = unit->getForUpdate(account_id);
  if (!current) {
    unit->rollback();
    return StatusChange::NOT_FOUND;
  }
  const AccountStatus previous = current->status;
  if (!isAllowedTransition(previous, *target)) {
    unit->rollback();
    return StatusChange::INVALID_TRANSITION;
  }

  current->status = *target;
  unit->save(*current);
  unit->commit();

  LEDGER_LOG_BUILDER(observability::LogLevel::INFO, "Account status changed")
      .field("account_id", account_id)
      .field("from", toString(previous))
      .field("to", toString(*target));

  if (applied) {
    *applied = *target;
  }
  return StatusChange::OK;
}

std::vector<TransactionRecord> AccountService::history(AccountId account_id, size_t limit) {
  return store_.transactionsFor(account_id, limit);
}

}  // namespace ledger
