#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace brvalid {

/** A minimal metrics sink interface (counters + histograms + gauges). */
struct MetricsSink {
  virtual ~MetricsSink() = default;

  /** Monotonic counters (e.g., rows processed, null rows, valid rows). */
  virtual void Counter(std::string_view name, uint64_t delta) = 0;

  /** Histograms (e.g., batch latency in microseconds). */
  virtual void Histogram(std::string_view name, uint64_t value) = 0;

  /** Gauges for point-in-time values (e.g., worker count).
   *  Default implementation does nothing. */
  virtual void Gauge(std::string_view name, double value) { (void)name; (void)value; }
};

/**
 * Prometheus-compatible metrics sink.
 *
 * Collects counters, histograms, and gauges and exports them
 * in Prometheus text exposition format. Dots in metric names are
 * exported as underscores.
 */
class PrometheusMetrics : public MetricsSink {
 public:
  PrometheusMetrics() = default;

  // MetricsSink interface
  void Counter(std::string_view name, uint64_t delta) override;
  void Histogram(std::string_view name, uint64_t value) override;
  void Gauge(std::string_view name, double value) override;

  /**
   * Generate Prometheus text format output.
   */
  std::string Export() const;

  /** Current value of a counter (0 if never incremented). */
  uint64_t CounterValue(std::string_view name) const;

  /** Number of observations recorded for a histogram. */
  uint64_t HistogramCount(std::string_view name) const;

 private:
  mutable std::mutex mu_;

  // Histograms use fixed latency buckets (microseconds)
  struct HistogramData {
    std::vector<uint64_t> buckets;
    uint64_t count = 0;
    double sum = 0.0;
  };

  // Ordered maps keep Export() output stable
  std::map<std::string, uint64_t, std::less<>> counters_;
  std::map<std::string, HistogramData, std::less<>> histograms_;
  std::map<std::string, double, std::less<>> gauges_;
};

namespace internal {

// Monotonic timestamp helper for metrics (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

}  // namespace internal
}  // namespace brvalid
