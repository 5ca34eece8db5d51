#include "../include/config.hpp"
#include "../include/observability/logger.hpp"
#include "../include/observability/metrics.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <stdexcept>

using namespace railway;
using namespace railway::observability;

// Logger writes to a captured stream for the duration of each test
class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_level_ = Logger::getInstance().getLogLevel();
    Logger::getInstance().setOutputStream(output_);
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::cout);
    Logger::getInstance().setLogLevel(previous_level_);
  }

  std::ostringstream output_;
  LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, EmitsOneJsonObjectPerLine) {
  LOG_BUILDER(LogLevel::INFO, "Booking \"confirmed\"")
      .field("train_id", "12951")
      .field("seats", std::vector<std::string>{"1", "2"})
      .field("fare", 1300.0)
      .field("tatkal", true);

  auto entry = nlohmann::json::parse(output_.str());
  EXPECT_EQ(entry.at("level"), "INFO");
  EXPECT_EQ(entry.at("message"), "Booking \"confirmed\"");
  EXPECT_EQ(entry.at("train_id"), "12951");
  EXPECT_EQ(entry.at("seats").size(), 2u);
  EXPECT_TRUE(entry.at("tatkal").get<bool>());
  EXPECT_EQ(entry.at("component"), "TestBody");
}

TEST_F(LoggerTest, ReplacesInvalidUtf8InFields) {
  EXPECT_NO_THROW(LOG_BUILDER(LogLevel::INFO, "Booking confirmed")
                      .field("user_id", "Ren\xE9")
                      .field("passengers", std::vector<std::string>{"Jos\xE9"}));

  auto entry = nlohmann::json::parse(output_.str());
  EXPECT_EQ(entry.at("user_id"), "Ren\xEF\xBF\xBD");
  EXPECT_EQ(entry.at("passengers")[0], "Jos\xEF\xBF\xBD");
}

TEST_F(LoggerTest, DropsMessagesBelowMinimumLevel) {
  LOG_DEBUG("hidden");
  EXPECT_TRUE(output_.str().empty());

  Logger::getInstance().warn("visible", "engine", "req-42");
  auto entry = nlohmann::json::parse(output_.str());
  EXPECT_EQ(entry.at("correlation_id"), "req-42");
  EXPECT_EQ(entry.at("component"), "engine");
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
  EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
  EXPECT_THROW(parseLogLevel("verbose"), std::invalid_argument);
}

TEST(MetricsCollectorTest, ExportsPrometheusText) {
  MetricsCollector metrics;
  metrics.describe("bookings_confirmed_total", "Bookings confirmed");
  metrics.incrementCounter("bookings_confirmed_total");
  metrics.incrementCounter("bookings_confirmed_total", 2);
  metrics.setGauge("active_bookings", 4);
  metrics.decrementGauge("active_bookings");
  metrics.observeHistogram("booking_latency_seconds", 0.002);
  metrics.observeHistogram("booking_latency_seconds", 3.0);

  EXPECT_EQ(metrics.counterValue("bookings_confirmed_total"), 3.0);
  EXPECT_EQ(metrics.gaugeValue("active_bookings"), 3.0);
  EXPECT_EQ(metrics.histogramCount("booking_latency_seconds"), 2u);

  std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# HELP bookings_confirmed_total Bookings confirmed"), std::string::npos);
  EXPECT_NE(text.find("bookings_confirmed_total 3"), std::string::npos);
  EXPECT_NE(text.find("booking_latency_seconds_bucket{le=\"0.005\"} 1"), std::string::npos);
  EXPECT_NE(text.find("booking_latency_seconds_bucket{le=\"+Inf\"} 2"), std::string::npos);

  metrics.reset();
  EXPECT_EQ(metrics.counterValue("bookings_confirmed_total"), 0.0);
}

TEST(MetricsCollectorTest, TimerRecordsOneObservation) {
  MetricsCollector metrics;
  { MetricsCollector::Timer timer(metrics, "op_seconds"); }
  EXPECT_EQ(metrics.histogramCount("op_seconds"), 1u);
}

// Configuration tests
TEST(ConfigTest, ServerDefaultsAndOverrides) {
  char prog[] = "reservation_server";
  char* no_args[] = {prog};
  ServerConfig defaults = ServerConfig::fromArgs(1, no_args);
  EXPECT_EQ(defaults.port, 8080);
  EXPECT_EQ(defaults.catalog_path, "data/trains.csv");

  char port[] = "9090";
  char path[] = "/tmp/trains.csv";
  char level[] = "debug";
  char* args[] = {prog, port, path, level};
  ServerConfig config = ServerConfig::fromArgs(4, args);
  EXPECT_EQ(config.port, 9090);
  EXPECT_EQ(config.catalog_path, "/tmp/trains.csv");
  EXPECT_EQ(config.log_level, LogLevel::DEBUG);

  char bad_port[] = "70000";
  char* bad_args[] = {prog, bad_port};
  EXPECT_THROW(ServerConfig::fromArgs(2, bad_args), std::invalid_argument);
}

TEST(ConfigTest, SimulatorArguments) {
  char prog[] = "traffic_simulator";
  char path[] = "trains.csv";
  char users[] = "12";
  char rounds[] = "4x";
  char* good[] = {prog, path, users};
  SimulatorConfig config = SimulatorConfig::fromArgs(3, good);
  EXPECT_EQ(config.users, 12u);
  EXPECT_EQ(config.rounds, 3u);

  char* bad[] = {prog, path, users, rounds};
  EXPECT_THROW(SimulatorConfig::fromArgs(4, bad), std::invalid_argument);
}
