#include "ingestvault/utilities/metrics.h"
#include <gtest/gtest.h>

using ingestvault::MetricsRegistry;

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
  std::map<std::string, std::string> labels{{"k", "v"}, {"a", "b"}};
  EXPECT_EQ(MetricsRegistry::labelsToString(labels), "{a=\"b\",k=\"v\"}");
  EXPECT_EQ(MetricsRegistry::labelsToString({}), "");
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
  auto &m = MetricsRegistry::instance();
  m.reset();
  m.setGauge("gauge", 2.5, {{"host", "localhost"}});
  m.incrementCounter("requests_total", 3);
  m.observe("latency_seconds", 1.2);
  std::string metrics = m.toPrometheus();
  EXPECT_NE(metrics.find("gauge{host=\"localhost\"} 2.5"), std::string::npos);
  EXPECT_NE(metrics.find("requests_total 3"), std::string::npos);
  EXPECT_NE(metrics.find("latency_seconds_sum 1.2"), std::string::npos);
  EXPECT_NE(metrics.find("latency_seconds_count 1"), std::string::npos);
  m.reset();
  EXPECT_TRUE(m.toPrometheus().empty());
}

TEST(MetricsRegistry, CountersAccumulatePerLabelSet) {
  auto &m = MetricsRegistry::instance();
  m.reset();
  m.incrementCounter("transfers_total", 1, {{"status", "verified"}});
  m.incrementCounter("transfers_total", 1, {{"status", "verified"}});
  m.incrementCounter("transfers_total", 1, {{"status", "failed"}});
  EXPECT_DOUBLE_EQ(m.counterValue("transfers_total", {{"status", "verified"}}), 2.0);
  EXPECT_DOUBLE_EQ(m.counterValue("transfers_total", {{"status", "failed"}}), 1.0);
  EXPECT_DOUBLE_EQ(m.counterValue("transfers_total"), 0.0);
  m.setGauge("safe", 1.0);
  m.setGauge("safe", 0.0);
  EXPECT_DOUBLE_EQ(m.gaugeValue("safe"), 0.0);
  m.reset();
}
