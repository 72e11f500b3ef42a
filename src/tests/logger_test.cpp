#include <gtest/gtest.h>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace dnsfs::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path log_file;

  void SetUp() override {
    test_dir = dnsfs::test::make_temp_dir("dnsfs_logger_test");
    log_file = test_dir / "test.log";
  }

  void TearDown() override {
    // Back to the quiet console sink the rest of the suite runs with
    init_console_logging(severity_level::warning);
    std::filesystem::remove_all(test_dir);
  }

  std::string read_log() {
    boost::log::core::get()->flush();
    std::ifstream file(log_file, std::ios::in | std::ios::binary);
    std::stringstream content;
    content << file.rdbuf();
    return content.str();
  }
};

TEST_F(LoggerTest, WritesToFile) {
  init_logging(log_file.string(), severity_level::info);
  BOOST_LOG_TRIVIAL(info) << "Test: info message";
  BOOST_LOG_TRIVIAL(error) << "Test: error message";

  auto content = read_log();
  EXPECT_NE(content.find("Logger: Logging initialized with file"), std::string::npos);
  EXPECT_NE(content.find("[info] Test: info message"), std::string::npos);
  EXPECT_NE(content.find("[error] Test: error message"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
  init_logging(log_file.string(), severity_level::warning);
  BOOST_LOG_TRIVIAL(debug) << "Test: hidden debug";
  BOOST_LOG_TRIVIAL(info) << "Test: hidden info";
  BOOST_LOG_TRIVIAL(warning) << "Test: visible warning";

  auto content = read_log();
  EXPECT_EQ(content.find("hidden"), std::string::npos);
  EXPECT_NE(content.find("Test: visible warning"), std::string::npos);
}

TEST_F(LoggerTest, AppendsAcrossRuns) {
  init_logging(log_file.string(), severity_level::info);
  BOOST_LOG_TRIVIAL(info) << "Test: first run";
  init_logging(log_file.string(), severity_level::info);
  BOOST_LOG_TRIVIAL(info) << "Test: second run";

  auto content = read_log();
  EXPECT_NE(content.find("Test: first run"), std::string::npos);
  EXPECT_NE(content.find("Test: second run"), std::string::npos);
}

TEST(SeverityTest, ParsesNames) {
  EXPECT_EQ(parse_severity("trace"), severity_level::trace);
  EXPECT_EQ(parse_severity("DEBUG"), severity_level::debug);
  EXPECT_EQ(parse_severity("Info"), severity_level::info);
  EXPECT_EQ(parse_severity("warn"), severity_level::warning);
  EXPECT_EQ(parse_severity("warning"), severity_level::warning);
  EXPECT_EQ(parse_severity("error"), severity_level::error);
  EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
  EXPECT_FALSE(parse_severity("verbose").has_value());
  EXPECT_FALSE(parse_severity("").has_value());
}

TEST(SeverityTest, Names) {
  EXPECT_STREQ(severity_name(severity_level::info), "INFO");
  EXPECT_STREQ(severity_name(severity_level::warning), "WARNING");
}
