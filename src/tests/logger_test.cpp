#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace fatsplit::logging;
namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
  fs::path test_dir;
  fs::path log_file;

  void SetUp() override {
    test_dir = make_test_dir("logger_test");
    log_file = test_dir / "fatsplit.log";
  }

  void TearDown() override {
    // Ensure all logs are written before the file goes away
    boost::log::core::get()->flush();
    boost::log::core::get()->remove_all_sinks();
    if (fs::exists(test_dir)) {
      fs::remove_all(test_dir);
    }
  }

  std::string log_contents() {
    boost::log::core::get()->flush();
    return read_file(log_file);
  }
};

TEST_F(LoggerTest, WritesToFileAtOrAboveLevel) {
  init_logging(log_file.string(), severity_level::info);

  LOG_INFO << "splitting started";
  LOG_DEBUG << "hidden detail";
  BOOST_LOG_TRIVIAL(warning) << "trivial warning";

  const std::string contents = log_contents();
  EXPECT_NE(contents.find("splitting started"), std::string::npos);
  EXPECT_NE(contents.find("[info]"), std::string::npos);
  EXPECT_NE(contents.find("trivial warning"), std::string::npos);
  EXPECT_EQ(contents.find("hidden detail"), std::string::npos);
}

TEST_F(LoggerTest, SetLogLevelChangesFilter) {
  init_logging(log_file.string(), severity_level::error);
  LOG_WARN << "dropped warning";

  set_log_level(severity_level::trace);
  LOG_TRACE << "kept trace";

  const std::string contents = log_contents();
  EXPECT_EQ(contents.find("dropped warning"), std::string::npos);
  EXPECT_NE(contents.find("kept trace"), std::string::npos);
}

TEST_F(LoggerTest, LogIsTruncatedOnInit) {
  write_file(log_file, "previous run\n");
  init_logging(log_file.string(), severity_level::info);
  LOG_INFO << "fresh run";

  const std::string contents = log_contents();
  EXPECT_EQ(contents.find("previous run"), std::string::npos);
  EXPECT_NE(contents.find("fresh run"), std::string::npos);
}

TEST(ParseSeverityTest, KnownAndUnknownNames) {
  EXPECT_EQ(parse_severity("trace").value(), severity_level::trace);
  EXPECT_EQ(parse_severity("debug").value(), severity_level::debug);
  EXPECT_EQ(parse_severity("warning").value(), severity_level::warning);
  EXPECT_EQ(parse_severity("fatal").value(), severity_level::fatal);
  EXPECT_FALSE(parse_severity("loud").has_value());
  EXPECT_FALSE(parse_severity("INFO").has_value());
}
