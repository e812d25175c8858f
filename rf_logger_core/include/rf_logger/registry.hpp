#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#include "log_config.hpp"
#include "logger.hpp"

namespace rf_logger
{

// Process-wide name -> Logger map.
//
// Duplicate handling:
//   same name, equivalent config  -> the existing handle is returned
//   same name, different config   -> kDuplicateInstance
//   other name, same active file  -> kPathInUse (any spelling of the directory)
class LoggerRegistry
{
 public:
  static LoggerRegistry& Instance();

  std::shared_ptr<Logger> Init(const LogConfig& config, std::error_code& ec);

  std::shared_ptr<Logger> Get(const std::string& name) const;

  // Drains and unregisters; false if the name is unknown.
  bool Shutdown(const std::string& name);

  void ShutdownAll();

  std::vector<std::string> Names() const;

 private:
  LoggerRegistry() = default;
  ~LoggerRegistry();

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Logger>> loggers_;
};

std::shared_ptr<Logger> init_logger(const LogConfig& config, std::error_code& ec);
std::shared_ptr<Logger> get_logger(const std::string& name);

}  // namespace rf_logger
