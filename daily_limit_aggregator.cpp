#include "daily_limit_aggregator.hpp"

#include "observability/logger.hpp"

namespace ledger {

namespace {

using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

}  // namespace

// system_clock counts from a UTC midnight and ignores leap seconds, so a
// day boundary is a multiple of 86400 seconds since the epoch.
DayWindow utcDayWindow(Timestamp now) {
  auto midnight = std::chrono::floor<Days>(now);
  DayWindow window;
  window.start = std::chrono::time_point_cast<std::chrono::microseconds>(midnight);
  window.end = window.start + Days(1) - std::chrono::microseconds(1);
  return window;
}

Money DailyLimitAggregator::transferredToday(LedgerStore::Unit& unit, AccountId account_id,
                                             Timestamp now) const {
  DayWindow window = utcDayWindow(now);
  Money sent = unit.sumSentSince(account_id, window.start, window.end);

  LEDGER_LOG_BUILDER(observability::LogLevel::DEBUG, "Computed amount sent today")
      .field("account_id", account_id)
      .field("window_start", formatTimestamp(window.start))
      .field("sent", sent);

  return sent;
}

}  // namespace ledger
