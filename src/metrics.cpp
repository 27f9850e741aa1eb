#include <brvalid/metrics.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace brvalid {

namespace {

// Histogram buckets for batch latency (in microseconds)
const std::vector<double> kLatencyBuckets = {
    100, 250, 500, 1000, 2500, 5000, 10000, 25000, 50000,
    100000, 250000, 500000, 1000000, 5000000};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

std::string ExportName(const std::string& name) {
  std::string out = name;
  std::replace(out.begin(), out.end(), '.', '_');
  return out;
}

}  // namespace

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = counters_.find(name);
  if (it == counters_.end()) {
    counters_.emplace(std::string(name), delta);
  } else {
    it->second += delta;
  }
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = histograms_.find(name);
  if (it == histograms_.end()) {
    it = histograms_.emplace(std::string(name), HistogramData{}).first;
  }
  auto& h = it->second;
  if (h.buckets.empty()) {
    h.buckets.resize(kLatencyBuckets.size() + 1, 0);
  }
  size_t bucket = FindBucket(static_cast<double>(value), kLatencyBuckets);
  for (size_t i = bucket; i < h.buckets.size(); ++i) {
    h.buckets[i]++;
  }
  h.count++;
  h.sum += static_cast<double>(value);
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = gauges_.find(name);
  if (it == gauges_.end()) {
    gauges_.emplace(std::string(name), value);
  } else {
    it->second = value;
  }
}

uint64_t PrometheusMetrics::CounterValue(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0 : it->second;
}

uint64_t PrometheusMetrics::HistogramCount(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = histograms_.find(name);
  return it == histograms_.end() ? 0 : it->second.count;
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  // Export counters
  for (const auto& [raw_name, value] : counters_) {
    std::string name = ExportName(raw_name);
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
  }

  // Export gauges
  for (const auto& [raw_name, value] : gauges_) {
    std::string name = ExportName(raw_name);
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << value << "\n";
  }

  // Export histograms
  for (const auto& [raw_name, data] : histograms_) {
    std::string name = ExportName(raw_name);
    out << "# TYPE " << name << " histogram\n";
    for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
      out << name << "_bucket{le=\"" << kLatencyBuckets[i] << "\"} "
          << data.buckets[i] << "\n";
    }
    out << name << "_bucket{le=\"+Inf\"} " << data.buckets.back() << "\n";
    out << name << "_sum " << data.sum << "\n";
    out << name << "_count " << data.count << "\n";
  }

  return out.str();
}

}  // namespace brvalid
