#ifndef LEDGER_TRANSFER_ENGINE_HPP_
#define LEDGER_TRANSFER_ENGINE_HPP_

#include "daily_limit_aggregator.hpp"
#include "ledger_store.hpp"
#include "observability/metrics.hpp"

#include <functional>
#include <optional>
#include <string>

namespace ledger {

/**
 * Outcome of a transfer request. Everything except SUCCESS is a rejection
 * that left the ledger untouched.
 */
enum class TransferStatus {
  SUCCESS,
  INVALID_REQUEST,
  NOT_FOUND,
  ACCOUNT_INACTIVE,
  ACCOUNT_CANNOT_RECEIVE,
  INSUFFICIENT_FUNDS,
  DAILY_LIMIT_EXCEEDED,
  TRANSFER_FAILED
};

std::string toString(TransferStatus status);

struct TransferReceipt {
  AccountId from_account_id = 0;
  AccountId to_account_id = 0;
  Money amount;
  TransactionId transaction_id = 0;
  Timestamp created_at;
};

/**
 * Diagnostics attached to DAILY_LIMIT_EXCEEDED.
 */
struct LimitBreach {
  Money limit;
  Money transferred_today;
  Money attempted;
};

struct TransferResult {
  TransferStatus status = TransferStatus::TRANSFER_FAILED;
  std::string message;
  std::optional<TransferReceipt> receipt;
  std::optional<LimitBreach> limit_breach;

  bool ok() const { return status == TransferStatus::SUCCESS; }

  static TransferResult success(const TransferReceipt& receipt);
  static TransferResult rejected(TransferStatus status, const std::string& message);
  static TransferResult limitExceeded(const LimitBreach& breach);
};

struct TransferLimits {
  Money daily_limit = Money::fromUnits(200000);
};

/**
 * Moves funds between two accounts as one atomic unit of the LedgerStore.
 *
 * Both row locks are taken in ascending account id order, whichever side is
 * the source, so concurrent transfers in opposite directions cannot form a
 * lock cycle. Balances and the day's outgoing total are read only after both
 * locks are held.
 */
class TransferEngine {
 public:
  using Clock = std::function<Timestamp()>;

  TransferEngine(LedgerStore& store, TransferLimits limits, Clock clock = nowUtc,
                 observability::MetricsCollector& metrics = observability::getGlobalMetrics());

  // Non-copyable
  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  /**
   * Transfers `amount` from `from_account_id` to `to_account_id`.
   * Never throws for store faults; those come back as TRANSFER_FAILED after
   * the unit has been rolled back.
   */
  TransferResult transfer(AccountId from_account_id, AccountId to_account_id, const Money& amount);

  const TransferLimits& limits() const { return limits_; }

 private:
  TransferResult execute(AccountId from_account_id, AccountId to_account_id, const Money& amount);

  void record(const TransferResult& result, AccountId from_account_id, AccountId to_account_id,
              const Money& amount);

  LedgerStore& store_;
  const TransferLimits limits_;
  Clock clock_;
  observability::MetricsCollector& metrics_;
  DailyLimitAggregator aggregator_;
};

}  // namespace ledger

#endif  // LEDGER_TRANSFER_ENGINE_HPP_
