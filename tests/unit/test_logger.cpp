#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using mirror::common::Logger;

TEST(LoggerTest, ParsesLevelNamesCaseInsensitively) {
  EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
  EXPECT_EQ(Logger::parseLevel("DEBUG"), spdlog::level::debug);
  EXPECT_EQ(Logger::parseLevel("Info"), spdlog::level::info);
  EXPECT_EQ(Logger::parseLevel("warn"), spdlog::level::warn);
  EXPECT_EQ(Logger::parseLevel("warning"), spdlog::level::warn);
  EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
  EXPECT_EQ(Logger::parseLevel("critical"), spdlog::level::critical);
  EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
}

TEST(LoggerTest, RejectsUnknownLevel) {
  EXPECT_THROW(Logger::parseLevel("verbose"), std::invalid_argument);
}

TEST(LoggerTest, ReinitializationOnlyChangesLevel) {
  Logger::init("warn");
  auto spBefore = Logger::get();
  Logger::init("error");
  EXPECT_EQ(Logger::get(), spBefore);
  EXPECT_EQ(Logger::get()->level(), spdlog::level::err);
  Logger::setLevel("warn");
  EXPECT_EQ(Logger::get()->level(), spdlog::level::warn);
}
