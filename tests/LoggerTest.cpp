// LoggerTest.cpp

#include <gtest/gtest.h>

#include "FakeDevices.h"
#include "src/infrastructure/Logger.h"

namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { saved_ = Logger::level(); }
  void TearDown() override { Logger::setLevel(saved_); }

 private:
  LogLevel saved_ = LOG_LEVEL_INFO;
};

}  // namespace

TEST_F(LoggerTest, PrefixesLevelAndFormats) {
  LogCapture capture;
  Logger::setLevel(LOG_LEVEL_DEBUG);
  Logger::error("code %d", 7);
  Logger::warn("%s", "careful");
  Logger::info("pin %u", 4u);
  Logger::debug("x");

  ASSERT_EQ(4u, capture.lines.size());
  EXPECT_EQ("[E] code 7", capture.lines[0]);
  EXPECT_EQ("[W] careful", capture.lines[1]);
  EXPECT_EQ("[I] pin 4", capture.lines[2]);
  EXPECT_EQ("[D] x", capture.lines[3]);
}

TEST_F(LoggerTest, DropsLinesAboveCurrentLevel) {
  LogCapture capture;
  Logger::setLevel(LOG_LEVEL_WARN);
  Logger::info("hidden");
  Logger::debug("hidden");
  Logger::warn("shown");
  Logger::error("shown");
  EXPECT_EQ(2u, capture.lines.size());
  EXPECT_FALSE(capture.contains("hidden"));
}

TEST_F(LoggerTest, LongLinesAreTruncated) {
  LogCapture capture;
  std::string longText(1000, 'x');
  Logger::error("%s", longText.c_str());
  ASSERT_EQ(1u, capture.lines.size());
  EXPECT_LT(capture.lines[0].size(), 256u);
  EXPECT_EQ(0u, capture.lines[0].find("[E] xxx"));
}
