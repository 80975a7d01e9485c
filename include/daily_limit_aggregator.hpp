#ifndef LEDGER_DAILY_LIMIT_AGGREGATOR_HPP_
#define LEDGER_DAILY_LIMIT_AGGREGATOR_HPP_

#include "ledger_store.hpp"

namespace ledger {

/**
 * Calendar day containing an instant, in UTC, as an inclusive range:
 * [midnight, next midnight - 1us].
 */
struct DayWindow {
  Timestamp start;
  Timestamp end;
};

DayWindow utcDayWindow(Timestamp now);

/**
 * Computes how much an account has already sent during the current UTC day.
 *
 * Stateless and uncached: every call goes to the store through the caller's
 * unit, so a transfer that committed a moment ago is always counted.
 */
class DailyLimitAggregator {
 public:
  Money transferredToday(LedgerStore::Unit& unit, AccountId account_id, Timestamp now) const;
};

}  // namespace ledger

#endif  // LEDGER_DAILY_LIMIT_AGGREGATOR_HPP_
