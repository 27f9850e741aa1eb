// Unit tests for brvalid/metrics.hpp
// Tests: Prometheus export of counters, gauges and histograms

#include <gtest/gtest.h>

#include <brvalid/metrics.hpp>

#include <string>
#include <thread>
#include <vector>

namespace brvalid {
namespace {

class MetricsTest : public ::testing::Test {
 protected:
  PrometheusMetrics metrics_;
};

TEST_F(MetricsTest, Counter) {
  metrics_.Counter("test_counter", 1);
  metrics_.Counter("test_counter", 5);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("# TYPE test_counter counter"), std::string::npos);
  EXPECT_NE(output.find("test_counter 6"), std::string::npos);
  EXPECT_EQ(metrics_.CounterValue("test_counter"), 6u);
  EXPECT_EQ(metrics_.CounterValue("never_touched"), 0u);
}

TEST_F(MetricsTest, Gauge) {
  metrics_.Gauge("test_gauge", 7.0);
  metrics_.Gauge("test_gauge", 42.5);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("# TYPE test_gauge gauge"), std::string::npos);
  EXPECT_NE(output.find("test_gauge 42.5"), std::string::npos);
}

TEST_F(MetricsTest, Histogram) {
  metrics_.Histogram("test_latency_us", 50);
  metrics_.Histogram("test_latency_us", 300);
  metrics_.Histogram("test_latency_us", 10000000);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("# TYPE test_latency_us histogram"), std::string::npos);
  EXPECT_NE(output.find("test_latency_us_bucket{le=\"100.000000\"} 1"), std::string::npos);
  EXPECT_NE(output.find("test_latency_us_bucket{le=\"500.000000\"} 2"), std::string::npos);
  EXPECT_NE(output.find("test_latency_us_bucket{le=\"+Inf\"} 3"), std::string::npos);
  EXPECT_NE(output.find("test_latency_us_count 3"), std::string::npos);
  EXPECT_EQ(metrics_.HistogramCount("test_latency_us"), 3u);
}

TEST_F(MetricsTest, DotsExportedAsUnderscores) {
  metrics_.Counter("brvalid.format_phone.rows_total", 10);
  std::string output = metrics_.Export();
  EXPECT_NE(output.find("brvalid_format_phone_rows_total 10"), std::string::npos);
  EXPECT_EQ(output.find("brvalid.format_phone"), std::string::npos);
  EXPECT_EQ(metrics_.CounterValue("brvalid.format_phone.rows_total"), 10u);
}

TEST_F(MetricsTest, EmptyExport) {
  EXPECT_TRUE(metrics_.Export().empty());
}

TEST_F(MetricsTest, ConcurrentCounters) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < 1000; ++i) metrics_.Counter("concurrent", 1);
    });
  }
  for (auto& t : threads) t.join();
  EXPECT_EQ(metrics_.CounterValue("concurrent"), 4000u);
}

TEST(MetricsSinkTest, DefaultGaugeIsNoOp) {
  struct CountingSink : MetricsSink {
    void Counter(std::string_view, uint64_t delta) override { total += delta; }
    void Histogram(std::string_view, uint64_t) override {}
    uint64_t total = 0;
  };
  CountingSink sink;
  MetricsSink& base = sink;
  base.Gauge("ignored", 1.0);
  base.Counter("rows", 3);
  EXPECT_EQ(sink.total, 3u);
}

}  // namespace
}  // namespace brvalid
