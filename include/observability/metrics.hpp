#ifndef METRICS_HPP_
#define METRICS_HPP_

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace observability {

// Metric names emitted by the ledger.
extern const char* const kFundTotal;
extern const char* const kFundFailedTotal;
extern const char* const kFundAmountCentsTotal;
extern const char* const kFundDurationSeconds;
extern const char* const kAccountsOpenedTotal;
extern const char* const kPoolConnectionsInUse;

/**
 * Simple metrics collection system for monitoring ledger performance.
 * Supports counters, gauges, and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Attach HELP text to a metric name
  void describe(const std::string& name, const std::string& help);

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);
  double counterValue(const std::string& name) const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  void incrementGauge(const std::string& name, double value = 1.0);
  void decrementGauge(const std::string& name, double value = 1.0);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);
  size_t histogramCount(const std::string& name) const;

  // Observes the elapsed seconds into a histogram on destruction
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  // Reset all metrics
  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  std::string helpFor(const std::string& name, const std::string& fallback) const;

  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace ledger

#endif  // METRICS_HPP_
