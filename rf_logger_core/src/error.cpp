#include "rf_logger/error.hpp"

#include <string>

namespace rf_logger
{

namespace
{

class LogCategory : public std::error_category
{
 public:
  const char* name() const noexcept override { return "rf_logger"; }

  std::string message(int ev) const override
  {
    switch (static_cast<LogErrc>(ev))
    {
      case LogErrc::kInvalidConfig:
        return "invalid logger configuration";
      case LogErrc::kDirectoryUnavailable:
        return "log directory cannot be created or accessed";
      case LogErrc::kDuplicateInstance:
        return "logger instance name already registered with a different configuration";
      case LogErrc::kPathInUse:
        return "log file already owned by another logger instance";
      case LogErrc::kQueueFull:
        return "async queue full, line dropped";
      case LogErrc::kShutDown:
        return "logger has been shut down";
      case LogErrc::kNotOpen:
        return "log file is not open";
    }
    return "unknown rf_logger error";
  }
};

}  // namespace

const std::error_category& log_category()
{
  static LogCategory category;
  return category;
}

std::error_code make_error_code(LogErrc e)
{
  return {static_cast<int>(e), log_category()};
}

}  // namespace rf_logger
