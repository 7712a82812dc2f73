#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <boost/log/trivial.hpp>
#include "common/errors.hpp"
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace disk::logging;

class LoggerTest : public ::testing::Test {
protected:
  std::filesystem::path root;
  std::filesystem::path log_file;

  void SetUp() override {
    root = make_test_root("logger_test");
    log_file = root / "disk.log";
    init_logging(log_file.string(), severity_level::debug);
  }

  void TearDown() override {
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    std::filesystem::remove_all(root);
  }

  std::string log_content() const {
    boost::log::core::get()->flush();
    std::ifstream file(log_file, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
  }
};

TEST_F(LoggerTest, WritesToFile) {
  BOOST_LOG_TRIVIAL(info) << "LoggerTest: info message";
  BOOST_LOG_TRIVIAL(debug) << "LoggerTest: debug message";

  const std::string content = log_content();
  EXPECT_NE(content.find("[info] LoggerTest: info message"), std::string::npos);
  EXPECT_NE(content.find("[debug] LoggerTest: debug message"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowLevel) {
  set_log_level(severity_level::warning);
  BOOST_LOG_TRIVIAL(info) << "LoggerTest: filtered";
  BOOST_LOG_TRIVIAL(error) << "LoggerTest: kept";

  const std::string content = log_content();
  EXPECT_EQ(content.find("LoggerTest: filtered"), std::string::npos);
  EXPECT_NE(content.find("LoggerTest: kept"), std::string::npos);
}

TEST_F(LoggerTest, AppendsAcrossInitializations) {
  BOOST_LOG_TRIVIAL(info) << "LoggerTest: first run";
  init_logging(log_file.string(), severity_level::info);
  BOOST_LOG_TRIVIAL(info) << "LoggerTest: second run";

  const std::string content = log_content();
  EXPECT_NE(content.find("LoggerTest: first run"), std::string::npos);
  EXPECT_NE(content.find("LoggerTest: second run"), std::string::npos);
}

TEST_F(LoggerTest, ParsesSeverityNames) {
  EXPECT_EQ(parse_severity("trace"), severity_level::trace);
  EXPECT_EQ(parse_severity("warning"), severity_level::warning);
  EXPECT_EQ(parse_severity("fatal"), severity_level::fatal);
  EXPECT_THROW(parse_severity("loud"), disk::ConfigError);
}
