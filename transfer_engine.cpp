#include "transfer_engine.hpp"

#include "observability/logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace ledger {

std::string toString(TransferStatus status) {
  switch (status) {
    case TransferStatus::SUCCESS: return "SUCCESS";
    case TransferStatus::INVALID_REQUEST: return "INVALID_REQUEST";
    case TransferStatus::NOT_FOUND: return "NOT_FOUND";
    case TransferStatus::ACCOUNT_INACTIVE: return "ACCOUNT_INACTIVE";
    case TransferStatus::ACCOUNT_CANNOT_RECEIVE: return "ACCOUNT_CANNOT_RECEIVE";
    case TransferStatus::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
    case TransferStatus::DAILY_LIMIT_EXCEEDED: return "DAILY_LIMIT_EXCEEDED";
    case TransferStatus::TRANSFER_FAILED: return "TRANSFER_FAILED";
  }
  return "UNKNOWN";
}

TransferResult TransferResult::success(const TransferReceipt& receipt) {
  TransferResult result;
  result.status = TransferStatus::SUCCESS;
  result.message = "transfer completed";
  result.receipt = receipt;
  return result;
}

TransferResult TransferResult::rejected(TransferStatus status, const std::string& message) {
  TransferResult result;
  result.status = status;
  result.message = message;
  return result;
}

TransferResult TransferResult::limitExceeded(const LimitBreach& breach) {
  TransferResult result;
  result.status = TransferStatus::DAILY_LIMIT_EXCEEDED;
  result.message = "daily transfer limit exceeded: limit=" + breach.limit.toString() +
                   ", already_transferred_today=" + breach.transferred_today.toString() +
                   ", attempting=" + breach.attempted.toString();
  result.limit_breach = breach;
  return result;
}

TransferEngine::TransferEngine(LedgerStore& store, TransferLimits limits, Clock clock,
                               observability::MetricsCollector& metrics)
    : store_(store), limits_(limits), clock_(std::move(clock)), metrics_(metrics) {
  if (!limits_.daily_limit.isPositive()) {
    throw std::invalid_argument("daily transfer limit must be positive");
  }
  if (!clock_) {
    throw std::invalid_argument("transfer engine requires a clock");
  }
}

TransferResult TransferEngine::transfer(AccountId from_account_id, AccountId to_account_id,
                                        const Money& amount) {
  observability::MetricsCollector::Timer timer(metrics_, observability::kTransferDurationSeconds);
  TransferResult result = execute(from_account_id, to_account_id, amount);
  record(result, from_account_id, to_account_id, amount);
  return result;
}

TransferResult TransferEngine::execute(AccountId from_account_id, AccountId to_account_id,
                                       const Money& amount) {
  if (from_account_id == to_account_id) {
    return TransferResult::rejected(TransferStatus::INVALID_REQUEST,
                                    "from_account and to_account must differ");
  }
  if (!amount.isPositive()) {
    return TransferResult::rejected(TransferStatus::INVALID_REQUEST,
                                    "amount must be greater than zero");
  }

  std::unique_ptr<LedgerStore::Unit> unit;
  try {
    unit = store_.begin();

    // Canonical lock order: lower id first, regardless of direction.
    const AccountId first_id = std::min(from_account_id, to_account_id);
    const AccountId second_id = std::max(from_account_id, to_account_id);

    std::optional<Account> first = unit->getForUpdate(first_id);
    std::optional<Account> second = first ? unit->getForUpdate(second_id) : std::nullopt;
    if (!first || !second) {
      unit->rollback();
      return TransferResult::rejected(TransferStatus::NOT_FOUND,
                                      "source or destination account not found");
    }

    Account& source = first_id == from_account_id ? *first : *second;
    Account& destination = first_id == from_account_id ? *second : *first;

    if (!source.isActive()) {
      unit->rollback();
      return TransferResult::rejected(
          TransferStatus::ACCOUNT_INACTIVE,
          "source account status '" + toString(source.status) + "' cannot transact");
    }
    if (!destination.isActive()) {
      unit->rollback();
      return TransferResult::rejected(
          TransferStatus::ACCOUNT_CANNOT_RECEIVE,
          "destination account status '" + toString(destination.status) +
              "' cannot receive funds");
    }

    if (source.balance < amount) {
      unit->rollback();
      return TransferResult::rejected(TransferStatus::INSUFFICIENT_FUNDS, "insufficient funds");
    }

    const Timestamp now = clock_();
    const Money sent_today = aggregator_.transferredToday(*unit, from_account_id, now);
    if (sent_today + amount > limits_.daily_limit) {
      unit->rollback();
      return TransferResult::limitExceeded({limits_.daily_limit, sent_today, amount});
    }

    source.balance -= amount;
    destination.balance += amount;
    unit->save(source);
    unit->save(destination);

    NewTransaction entry;
    entry.from_account = from_account_id;
    entry.to_account = to_account_id;
    entry.amount = amount;
    entry.created_at = now;
    TransactionRecord record = unit->appendTransaction(entry);

    unit->commit();

    TransferReceipt receipt;
    receipt.from_account_id = from_account_id;
    receipt.to_account_id = to_account_id;
    receipt.amount = amount;
    receipt.transaction_id = record.id;
    receipt.created_at = record.created_at;
    return TransferResult::success(receipt);

  } catch (const std::exception& e) {
    if (unit) {
      try {
        unit->rollback();
      } catch (const std::exception& rollback_error) {
        LEDGER_LOG_BUILDER(observability::LogLevel::ERROR, "Rollback after failed transfer failed")
            .field("error", rollback_error.what());
      }
    }
    return TransferResult::rejected(TransferStatus::TRANSFER_FAILED,
                                    std::string("transfer failed: ") + e.what());
  }
}

void TransferEngine::record(const TransferResult& result, AccountId from_account_id,
                            AccountId to_account_id, const Money& amount) {
  using observability::LogLevel;

  switch (result.status) {
    case TransferStatus::SUCCESS:
      metrics_.incrementCounter(observability::kTransfersTotal);
      metrics_.incrementCounter(observability::kTransferAmountCentsTotal,
                                static_cast<double>(amount.minorUnits()));
      LEDGER_LOG_BUILDER(LogLevel::INFO, "Transfer committed")
          .field("from_account", from_account_id)
          .field("to_account", to_account_id)
          .field("amount", amount)
          .field("transaction_id", result.receipt->transaction_id);
      break;

    case TransferStatus::TRANSFER_FAILED:
      metrics_.incrementCounter(observability::kTransfersFailedTotal);
      LEDGER_LOG_BUILDER(LogLevel::ERROR, "Transfer failed")
          .field("from_account", from_account_id)
          .field("to_account", to_account_id)
          .field("amount", amount)
          .field("reason", result.message);
      break;

    default:
      metrics_.incrementCounter(observability::kTransfersRejectedTotal);
      LEDGER_LOG_BUILDER(LogLevel::WARN, "Transfer rejected")
          .field("from_account", from_account_id)
          .field("to_account", to_account_id)
          .field("amount", amount)
          .field("status", toString(result.status))
          .field("reason", result.message);
      break;
  }
}

}  // namespace ledger
