#pragma once
#include <system_error>

namespace rf_logger
{

// Library-level failures. OS failures stay in std::system_category().
enum class LogErrc
{
  kInvalidConfig = 1,
  kDirectoryUnavailable,
  kDuplicateInstance,
  kPathInUse,
  kQueueFull,
  kShutDown,
  kNotOpen
};

const std::error_category& log_category();

std::error_code make_error_code(LogErrc e);

}  // namespace rf_logger

namespace std
{

template <>
struct is_error_code_enum<rf_logger::LogErrc> : true_type
{
};

}  // namespace std
