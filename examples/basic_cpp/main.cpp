#include <rf_logger/logger.hpp>
#include <rf_logger/registry.hpp>

#include <cstdio>
#include <thread>

int main()
{
  // --- Instance setup ---

  // 1) "app" stream: async, default queue, rotates at 64 KiB keeping 5 backups
  rf_logger::LogConfig app_config;
  app_config.instance_name = "app";
  app_config.directory = "/tmp/rf_logger_example";
  app_config.file_name = "app";
  app_config.max_file_size = 64 * 1024;
  app_config.max_files = 5;

  // 2) "access" stream: synchronous, every line flushed before returning
  rf_logger::LogConfig access_config;
  access_config.instance_name = "access";
  access_config.directory = "/tmp/rf_logger_example";
  access_config.file_name = "access.log";
  access_config.max_file_size = 16 * 1024;
  access_config.max_files = 3;
  access_config.async = false;
  access_config.instant_flush = true;
  access_config.min_level = rf_logger::LogLevel::Info;

  std::error_code ec;
  auto app = rf_logger::init_logger(app_config, ec);
  if (!app)
  {
    std::fprintf(stderr, "cannot create app logger: %s\n", ec.message().c_str());
    return 1;
  }
  auto access = rf_logger::init_logger(access_config, ec);
  if (!access)
  {
    std::fprintf(stderr, "cannot create access logger: %s\n", ec.message().c_str());
    return 1;
  }

  // --- Basic logging ---

  RF_LOG_DEBUG(app, "debug value: {}", 42);
  RF_LOG_INFO(app, "hello {}, version {}", "world", "1.0");
  RF_LOG_WARN(app, "disk usage at {}%", 85);
  RF_LOG_ERROR(app, "connection failed: {}", "timeout");

  // filtered out by min_level
  RF_LOG_DEBUG(access, "not written");

  int status = 404;
  RF_LOG_WARN_IF(status != 200, access, "GET /index.html -> {}", status);

  // --- Multi-thread demo: both streams, looked up by name ---

  auto worker = [](int id)
  {
    auto app_logger = rf_logger::get_logger("app");
    auto access_logger = rf_logger::get_logger("access");
    for (int i = 0; i < 1000; ++i)
    {
      RF_LOG_INFO(app_logger, "worker {} message {}", id, i);
      RF_LOG_INFO(access_logger, "worker {} request {}", id, i);
    }
  };

  std::thread t1(worker, 1);
  std::thread t2(worker, 2);
  t1.join();
  t2.join();

  // --- Shutdown ---

  auto stats = app->Stats();
  std::printf("app: rotations=%llu dropped=%llu\n",
              static_cast<unsigned long long>(stats.rotations),
              static_cast<unsigned long long>(stats.dropped));

  RF_LOG_INFO(app, "shutting down");
  rf_logger::LoggerRegistry::Instance().ShutdownAll();

  std::printf("Example finished. Check /tmp/rf_logger_example/ for app*.log and access*.log.\n");
  return 0;
}
