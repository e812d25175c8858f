#include <gtest/gtest.h>

#include "rf_logger/error.hpp"
#include "rf_logger/log_config.hpp"

using rf_logger::LogConfig;
using rf_logger::LogErrc;

TEST(LogConfig, DefaultsAreValid)
{
  LogConfig config;
  EXPECT_FALSE(rf_logger::validate_config(config));
  EXPECT_EQ(config.directory, "logs");
  EXPECT_EQ(config.file_name, "record");
  EXPECT_EQ(config.max_file_size, 20u * 1024u * 1024u);
  EXPECT_EQ(config.max_files, 5u);
  EXPECT_TRUE(config.async);
  EXPECT_FALSE(config.instant_flush);
  EXPECT_EQ(config.instance_name, "default");
  EXPECT_EQ(config.min_level, rf_logger::LogLevel::Debug);
  EXPECT_EQ(config.overflow_policy, rf_logger::OverflowPolicy::kDropNewest);
}

TEST(LogConfig, RejectsEmptyNames)
{
  LogConfig config;
  config.directory = "";
  EXPECT_EQ(rf_logger::validate_config(config), LogErrc::kInvalidConfig);

  config = LogConfig();
  config.instance_name = "";
  EXPECT_EQ(rf_logger::validate_config(config), LogErrc::kInvalidConfig);

  config = LogConfig();
  config.file_name = "";
  EXPECT_EQ(rf_logger::validate_config(config), LogErrc::kInvalidConfig);
}

TEST(LogConfig, RejectsUnsafeFileNames)
{
  for (const char* name : {".", "..", "a/b", "../escape", "/abs"})
  {
    LogConfig config;
    config.file_name = name;
    EXPECT_EQ(rf_logger::validate_config(config), LogErrc::kInvalidConfig) << name;
  }
}

TEST(LogConfig, RejectsZeroLimits)
{
  LogConfig config;
  config.max_file_size = 0;
  EXPECT_EQ(rf_logger::validate_config(config), LogErrc::kInvalidConfig);

  config = LogConfig();
  config.max_files = 0;
  EXPECT_EQ(rf_logger::validate_config(config), LogErrc::kInvalidConfig);
}

TEST(LogConfig, QueueCapacityOnlyMattersWhenAsync)
{
  LogConfig config;
  config.queue_capacity = 0;
  EXPECT_EQ(rf_logger::validate_config(config), LogErrc::kInvalidConfig);

  config.async = false;
  EXPECT_FALSE(rf_logger::validate_config(config));
}

TEST(LogConfig, RejectsNegativeTimeouts)
{
  LogConfig config;
  config.drain_timeout = std::chrono::milliseconds(-1);
  EXPECT_EQ(rf_logger::validate_config(config), LogErrc::kInvalidConfig);
}

TEST(LogConfig, NormalizeStripsLogExtension)
{
  EXPECT_EQ(rf_logger::normalize_file_name("app.log"), "app");
  EXPECT_EQ(rf_logger::normalize_file_name("app"), "app");
  EXPECT_EQ(rf_logger::normalize_file_name("app.txt"), "app.txt");
  EXPECT_EQ(rf_logger::normalize_file_name(".log"), ".log");
}

TEST(LogConfig, ActiveFilePath)
{
  LogConfig config;
  config.directory = "/var/log/svc/";
  config.file_name = "access.log";
  EXPECT_EQ(rf_logger::active_file_path(config), "/var/log/svc/access.log");

  config.directory = "/var/log/svc";
  config.file_name = "access";
  EXPECT_EQ(rf_logger::active_file_path(config), "/var/log/svc/access.log");
}

TEST(LogConfig, ProcessSubdirAppendsExecutableName)
{
  LogConfig config;
  config.directory = "/tmp/base";
  EXPECT_EQ(rf_logger::resolve_directory(config), "/tmp/base");

  config.process_subdir = true;
  std::string exe = rf_logger::executable_name();
  EXPECT_FALSE(exe.empty());
  EXPECT_EQ(rf_logger::resolve_directory(config), "/tmp/base/" + exe);
}

TEST(LogConfig, EquivalenceIgnoresTimeouts)
{
  LogConfig a;
  LogConfig b;
  b.file_name = "record.log";
  b.drain_timeout = std::chrono::milliseconds(1);
  EXPECT_TRUE(rf_logger::equivalent_config(a, b));

  b.max_files = a.max_files + 1;
  EXPECT_FALSE(rf_logger::equivalent_config(a, b));

  b = a;
  b.min_level = rf_logger::LogLevel::Warn;
  EXPECT_FALSE(rf_logger::equivalent_config(a, b));
}
