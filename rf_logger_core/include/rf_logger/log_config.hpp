#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "log_level.hpp"
#include "platform.hpp"

namespace rf_logger
{

// What AsyncWriter does with a line when its queue is full.
enum class OverflowPolicy : uint8_t
{
  kDropNewest,  // never block, drop and count
  kBlock        // wait up to enqueue_timeout, then drop and count
};

struct LogConfig
{
  std::string directory = "logs";
  // Active file is "<file_name>.log", backups "<file_name>.<N>.log".
  std::string file_name = "record";
  size_t max_file_size = RF_LOG_DEFAULT_MAX_FILE_SIZE;
  size_t max_files = RF_LOG_DEFAULT_MAX_FILES;
  bool async = true;
  bool instant_flush = false;
  std::string instance_name = "default";
  LogLevel min_level = LogLevel::Debug;

  // async mode only
  size_t queue_capacity = RF_LOG_DEFAULT_QUEUE_CAPACITY;
  OverflowPolicy overflow_policy = OverflowPolicy::kDropNewest;
  std::chrono::milliseconds enqueue_timeout{10};
  std::chrono::milliseconds drain_timeout{RF_LOG_DEFAULT_DRAIN_TIMEOUT_MS};
  std::chrono::milliseconds fatal_drain_timeout{RF_LOG_DEFAULT_FATAL_DRAIN_TIMEOUT_MS};

  // Place files under "<directory>/<executable name>/".
  bool process_subdir = false;
};

std::error_code validate_config(const LogConfig& config);

// Directory the files actually live in, after process_subdir is applied.
std::string resolve_directory(const LogConfig& config);

// "app.log" and "app" name the same stream.
std::string normalize_file_name(const std::string& file_name);

// Full path of the active file, e.g. "logs/app.log".
std::string active_file_path(const LogConfig& config);

// True when two configs would build interchangeable loggers.
bool equivalent_config(const LogConfig& a, const LogConfig& b);

std::string executable_name();

}  // namespace rf_logger
