#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace ledger::observability;

// Test fixture that captures logger output
class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_level_ = Logger::getInstance().getLogLevel();
    Logger::getInstance().setOutputStream(output_);
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::clog);
    Logger::getInstance().setLogLevel(previous_level_);
  }

  std::stringstream output_;
  LogLevel previous_level_;
};

TEST_F(LoggerTest, WritesOneJsonLinePerEntry) {
  LOG_BUILDER(LogLevel::INFO, "Account funded", "funding")
      .field("account_id", 42L)
      .field("source", "card")
      .field("consistent", true);

  std::string line = output_.str();
  EXPECT_EQ(line.back(), '\n');
  EXPECT_NE(line.find("\"level\":\"INFO\""), std::string::npos);
  EXPECT_NE(line.find("\"message\":\"Account funded\""), std::string::npos);
  EXPECT_NE(line.find("\"component\":\"funding\""), std::string::npos);
  EXPECT_NE(line.find("\"account_id\":42"), std::string::npos);
  EXPECT_NE(line.find("\"source\":\"card\""), std::string::npos);
  EXPECT_NE(line.find("\"consistent\":true"), std::string::npos);
}

TEST_F(LoggerTest, DropsEntriesBelowMinimumLevel) {
  LOG_DEBUG("hidden", "test");
  EXPECT_TRUE(output_.str().empty());

  LOG_WARN("shown", "test");
  EXPECT_NE(output_.str().find("\"level\":\"WARN\""), std::string::npos);
}

TEST_F(LoggerTest, EscapesQuotesAndControlCharacters) {
  EXPECT_EQ(escapeJson("a\"b\\c\n"), "a\\\"b\\\\c\\n");
}

TEST(LogLevelTest, ParsesNames) {
  EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(MetricsCollectorTest, CountersGaugesAndHistograms) {
  MetricsCollector metrics;
  metrics.incrementCounter(kFundTotal);
  metrics.incrementCounter(kFundTotal, 2.0);
  metrics.incrementGauge(kPoolConnectionsInUse);
  metrics.incrementGauge(kPoolConnectionsInUse);
  metrics.decrementGauge(kPoolConnectionsInUse);
  metrics.observeHistogram(kFundDurationSeconds, 0.002);

  EXPECT_EQ(metrics.counterValue(kFundTotal), 3.0);
  EXPECT_EQ(metrics.gaugeValue(kPoolConnectionsInUse), 1.0);
  EXPECT_EQ(metrics.histogramCount(kFundDurationSeconds), 1u);
  EXPECT_EQ(metrics.counterValue("never_touched"), 0.0);
}

TEST(MetricsCollectorTest, ExportsPrometheusText) {
  MetricsCollector metrics;
  metrics.describe(kFundTotal, "Successful funding operations");
  metrics.incrementCounter(kFundTotal);
  {
    MetricsCollector::Timer timer(metrics, kFundDurationSeconds);
  }

  std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# HELP ledger_fund_total Successful funding operations"), std::string::npos);
  EXPECT_NE(text.find("# TYPE ledger_fund_total counter"), std::string::npos);
  EXPECT_NE(text.find("ledger_fund_duration_seconds_bucket{le=\"+Inf\"} 1"), std::string::npos);
  EXPECT_NE(text.find("ledger_fund_duration_seconds_count 1"), std::string::npos);

  metrics.reset();
  EXPECT_EQ(metrics.counterValue(kFundTotal), 0.0);
}
