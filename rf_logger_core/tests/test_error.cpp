#include <gtest/gtest.h>

#include <string>

#include "rf_logger/error.hpp"

using rf_logger::LogErrc;

TEST(LogError, CategoryName)
{
  EXPECT_STREQ(rf_logger::log_category().name(), "rf_logger");
}

TEST(LogError, EnumConvertsImplicitly)
{
  std::error_code ec = LogErrc::kQueueFull;
  EXPECT_TRUE(ec);
  EXPECT_EQ(ec, LogErrc::kQueueFull);
  EXPECT_NE(ec, LogErrc::kShutDown);
  EXPECT_EQ(&ec.category(), &rf_logger::log_category());
}

TEST(LogError, EveryCodeHasMessage)
{
  for (LogErrc e : {LogErrc::kInvalidConfig, LogErrc::kDirectoryUnavailable,
                    LogErrc::kDuplicateInstance, LogErrc::kPathInUse, LogErrc::kQueueFull,
                    LogErrc::kShutDown, LogErrc::kNotOpen})
  {
    std::string msg = rf_logger::make_error_code(e).message();
    EXPECT_FALSE(msg.empty());
    EXPECT_NE(msg, "unknown rf_logger error");
  }
}

TEST(LogError, DistinctFromSystemErrors)
{
  std::error_code io = std::make_error_code(std::errc::io_error);
  EXPECT_NE(io, LogErrc::kNotOpen);
  EXPECT_NE(rf_logger::make_error_code(LogErrc::kInvalidConfig), std::errc::invalid_argument);
}

TEST(LogError, UnknownValue)
{
  std::error_code ec(999, rf_logger::log_category());
  EXPECT_EQ(ec.message(), "unknown rf_logger error");
}
