#ifndef LEDGER_ACCOUNT_SERVICE_HPP_
#define LEDGER_ACCOUNT_SERVICE_HPP_

#include "ledger_store.hpp"
#include "observability/metrics.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ledger {

enum class StatusChange {
  OK,
  NOT_FOUND,
  INVALID_STATUS,
  INVALID_TRANSITION
};

std::string toString(StatusChange change);

/**
 * Whether an account may move from one status to another.
 * CLOSED is terminal; ACTIVE and FROZEN move freely between each other.
 */
bool isAllowedTransition(AccountStatus from, AccountStatus to);

/**
 * Account lifecycle operations around the transfer engine: creation,
 * lookup, status changes and history.
 */
class AccountService {
 public:
  explicit AccountService(LedgerStore& store,
                          observability::MetricsCollector& metrics = observability::getGlobalMetrics());

  /**
   * Creates an ACTIVE account. Throws std::invalid_argument for a blank
   * account number or negative balance, StoreError for duplicates.
   */
  Account createAccount(const NewAccount& request);

  std::optional<Account> getAccount(AccountId account_id);

  /**
   * Applies a status given as text ("frozen", "ACTIVE", ...).
   * `applied` receives the resulting status when the change is OK.
   */
  StatusChange changeStatus(AccountId account_id, const std::string& status,
                            AccountStatus* applied = nullptr);

  std::vector<TransactionRecord> history(AccountId account_id, size_t limit = 100);

 private:
  LedgerStore& store_;
  observability::MetricsCollector& metrics_;
};

}  // namespace ledger

#endif  // LEDGER_ACCOUNT_SERVICE_HPP_
