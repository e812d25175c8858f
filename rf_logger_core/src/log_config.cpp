#include "rf_logger/log_config.hpp"

#include "rf_logger/error.hpp"
#include "rf_logger/rotation_policy.hpp"

#if defined(RF_LOG_PLATFORM_LINUX)
#include <unistd.h>
#include <climits>
#endif

namespace rf_logger
{

namespace
{

constexpr std::string_view kLogExtension = ".log";

std::string join_path(const std::string& dir, const std::string& name)
{
  std::string result = dir;
  if (!result.empty() && result.back() != '/')
  {
    result += '/';
  }
  result += name;
  return result;
}

}  // namespace

std::error_code validate_config(const LogConfig& config)
{
  if (config.directory.empty() || config.instance_name.empty())
  {
    return LogErrc::kInvalidConfig;
  }

  std::string name = normalize_file_name(config.file_name);
  if (name.empty() || name == "." || name == ".." ||
      name.find('/') != std::string::npos)
  {
    return LogErrc::kInvalidConfig;
  }

  if (config.max_file_size == 0 || config.max_files == 0)
  {
    return LogErrc::kInvalidConfig;
  }

  if (config.async && config.queue_capacity == 0)
  {
    return LogErrc::kInvalidConfig;
  }

  if (config.enqueue_timeout.count() < 0 || config.drain_timeout.count() < 0 ||
      config.fatal_drain_timeout.count() < 0)
  {
    return LogErrc::kInvalidConfig;
  }

  return {};
}

std::string resolve_directory(const LogConfig& config)
{
  if (!config.process_subdir)
  {
    return config.directory;
  }
  return join_path(config.directory, executable_name());
}

std::string normalize_file_name(const std::string& file_name)
{
  if (file_name.size() > kLogExtension.size() &&
      file_name.compare(file_name.size() - kLogExtension.size(), kLogExtension.size(),
                        kLogExtension.data()) == 0)
  {
    return file_name.substr(0, file_name.size() - kLogExtension.size());
  }
  return file_name;
}

std::string active_file_path(const LogConfig& config)
{
  return active_path(join_path(resolve_directory(config),
                               normalize_file_name(config.file_name)));
}

bool equivalent_config(const LogConfig& a, const LogConfig& b)
{
  return active_file_path(a) == active_file_path(b) &&
         a.max_file_size == b.max_file_size && a.max_files == b.max_files &&
         a.async == b.async && a.instant_flush == b.instant_flush &&
         a.min_level == b.min_level && a.queue_capacity == b.queue_capacity &&
         a.overflow_policy == b.overflow_policy;
}

std::string executable_name()
{
#if defined(RF_LOG_PLATFORM_LINUX)
  char buf[PATH_MAX];
  ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (n > 0)
  {
    buf[n] = '\0';
    std::string path(buf, static_cast<size_t>(n));
    size_t slash = path.rfind('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    if (!name.empty())
    {
      return name;
    }
  }
#endif
  return "unknown";
}

}  // namespace rf_logger
