#include "rf_logger/registry.hpp"

#include "rf_logger/error.hpp"

namespace rf_logger
{

LoggerRegistry& LoggerRegistry::Instance()
{
  static LoggerRegistry inst;
  return inst;
}

LoggerRegistry::~LoggerRegistry() { ShutdownAll(); }

std::shared_ptr<Logger> LoggerRegistry::Init(const LogConfig& config, std::error_code& ec)
{
  ec = validate_config(config);
  if (ec)
  {
    return nullptr;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(config.instance_name);
  if (it != loggers_.end())
  {
    if (equivalent_config(it->second->Config(), config))
    {
      return it->second;
    }
    ec = LogErrc::kDuplicateInstance;
    return nullptr;
  }

  // Fails with kPathInUse when another open logger owns the active file.
  auto logger = Logger::Create(config, ec);
  if (!logger)
  {
    return nullptr;
  }
  loggers_.emplace(config.instance_name, logger);
  return logger;
}

std::shared_ptr<Logger> LoggerRegistry::Get(const std::string& name) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  return it == loggers_.end() ? nullptr : it->second;
}

bool LoggerRegistry::Shutdown(const std::string& name)
{
  std::shared_ptr<Logger> logger;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it == loggers_.end())
    {
      return false;
    }
    logger = std::move(it->second);
    loggers_.erase(it);
  }
  // Drain outside the lock; other instances stay usable meanwhile.
  logger->Shutdown();
  return true;
}

void LoggerRegistry::ShutdownAll()
{
  std::map<std::string, std::shared_ptr<Logger>> loggers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loggers.swap(loggers_);
  }
  for (auto& entry : loggers)
  {
    entry.second->Shutdown();
  }
}

std::vector<std::string> LoggerRegistry::Names() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_)
  {
    names.push_back(entry.first);
  }
  return names;
}

std::shared_ptr<Logger> init_logger(const LogConfig& config, std::error_code& ec)
{
  return LoggerRegistry::Instance().Init(config, ec);
}

std::shared_ptr<Logger> get_logger(const std::string& name)
{
  return LoggerRegistry::Instance().Get(name);
}

}  // namespace rf_logger
