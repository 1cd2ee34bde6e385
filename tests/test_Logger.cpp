#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "utils/Logger.h"

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
  fs::path logPath = fs::temp_directory_path() / "tether_logger_test.log";
  std::vector<std::pair<LogLevel, std::string>> records;

  void SetUp() override {
    std::error_code ec;
    fs::remove(logPath, ec);
    auto& log = Logger::getInstance();
    log.setConsoleEnabled(false);
    log.setLogFile(logPath.string());
    log.setCallback([this](LogLevel level, const std::string& m) { records.emplace_back(level, m); });
  }

  void TearDown() override {
    auto& log = Logger::getInstance();
    log.setCallback(nullptr);
    log.setDebugEnabled(false);
    log.setLogFile("");
    log.setConsoleEnabled(true);
    std::error_code ec;
    fs::remove(logPath, ec);
  }
};

TEST_F(LoggerTest, DebugIsDroppedUnlessEnabled) {
  auto& log = Logger::getInstance();
  log.debug("hidden");
  EXPECT_TRUE(records.empty());

  log.setDebugEnabled(true);
  log.debug("shown");
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].first, LogLevel::DEBUG);
}

TEST_F(LoggerTest, RecordsAreAppendedToFileWithLevel) {
  auto& log = Logger::getInstance();
  log.warn("[Test] first");
  log.error("[Test] second");

  std::ifstream in(logPath);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) lines.push_back(line);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("[WARN] [Test] first"), std::string::npos);
  EXPECT_NE(lines[1].find("[ERROR] [Test] second"), std::string::npos);
  EXPECT_EQ(lines[0].front(), '[');
  EXPECT_EQ(records.size(), 2u);
}
