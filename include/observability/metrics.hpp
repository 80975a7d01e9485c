#ifndef LEDGER_OBSERVABILITY_METRICS_HPP_
#define LEDGER_OBSERVABILITY_METRICS_HPP_

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace observability {

// Metric names emitted by the transfer path.
constexpr const char* kTransfersTotal = "ledger_transfers_total";
constexpr const char* kTransfersRejectedTotal = "ledger_transfers_rejected_total";
constexpr const char* kTransfersFailedTotal = "ledger_transfers_failed_total";
constexpr const char* kTransferAmountCentsTotal = "ledger_transfer_amount_cents_total";
constexpr const char* kTransferDurationSeconds = "ledger_transfer_duration_seconds";
constexpr const char* kAccountsCreatedTotal = "ledger_accounts_created_total";
constexpr const char* kDbPoolAvailable = "ledger_db_pool_available_connections";

/**
 * Metrics registry with counters, gauges and histograms, exported in the
 * Prometheus text exposition format. Exported names are sorted.
 */
class MetricsCollector {
 public:
  MetricsCollector() = default;
  ~MetricsCollector() = default;

  // Optional HELP text; metrics without one get a generic line.
  void describe(const std::string& name, const std::string& help);

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);
  double counterValue(const std::string& name) const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);
  uint64_t histogramCount(const std::string& name) const;

  // Records elapsed seconds into a histogram when destroyed.
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  std::string exportMetrics() const;

  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    uint64_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    uint64_t count{0};
    double sum{0.0};
  };

  std::string helpFor(const std::string& name, const char* fallback) const;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();

  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;
};

/**
 * Registers HELP text for the ledger's metric names.
 */
void describeLedgerMetrics(MetricsCollector& collector);

// Global metrics instance, with the ledger metrics described.
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_OBSERVABILITY_METRICS_HPP_
