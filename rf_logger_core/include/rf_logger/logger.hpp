#pragma once
#include "log_level.hpp"
#include "log_config.hpp"
#include "log_record.hpp"
#include "writer_interface.hpp"
#include "sinks/sink_interface.hpp"

#include <atomic>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>

#include <fmt/format.h>

namespace rf_logger {

class FileSink;

struct LoggerStats {
    uint64_t dropped           = 0;
    uint64_t write_failures    = 0;
    uint64_t lost_on_shutdown  = 0;
    uint64_t rotations         = 0;
    uint64_t rotation_failures = 0;
};

// One independent log stream. Handles are std::shared_ptr<Logger>; copies
// share the same sink and queue.
class Logger {
public:
    // Validates config, creates the directory, opens "<file_name>.log" and,
    // in async mode, starts the consumer thread. Returns null and sets ec on
    // failure; kPathInUse if a live logger already writes that file.
    static std::shared_ptr<Logger> Create(const LogConfig& config, std::error_code& ec);

    // Same, but delivers lines to a caller-provided sink instead of files.
    static std::shared_ptr<Logger> CreateWithSink(const LogConfig& config,
                                                  std::unique_ptr<ILineSink> sink,
                                                  std::error_code& ec);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Sync mode returns the sink's I/O error; async mode only reports
    // kQueueFull / kShutDown, write failures are counted instead.
    std::error_code Log(LogLevel level, std::string_view message);

    template <typename... Args>
    std::error_code Logf(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args);

    // Always written, as ERROR with a "FATAL: " prefix, then the process exits
    // with EXIT_FAILURE once the line is on disk (sync) or the queue has been
    // drained for up to fatal_drain_timeout (async).
    [[noreturn]] void Fatal(std::string_view message);

    template <typename... Args>
    [[noreturn]] void Fatalf(fmt::format_string<Args...> fmt, Args&&... args);

    void SetLevel(LogLevel level);
    LogLevel Level() const;
    bool ShouldLog(LogLevel level) const { return level >= Level(); }

    std::error_code Flush();

    // Stops accepting lines and drains (async) for up to drain_timeout.
    // Returns the number of lines lost.
    size_t Shutdown();

    const std::string& Name() const { return config_.instance_name; }
    const LogConfig& Config() const { return config_; }
    const std::string& ActivePath() const { return active_path_; }
    LoggerStats Stats() const;

private:
    Logger(const LogConfig& config, std::unique_ptr<ILineWriter> writer,
           const FileSink* file_sink, std::string active_path);

    static std::shared_ptr<Logger> Build(const LogConfig& config,
                                         std::unique_ptr<ILineSink> sink,
                                         const FileSink* file_sink,
                                         std::string active_path,
                                         std::error_code& ec);

    std::error_code Dispatch(LogLevel level, std::string_view message);

    const LogConfig config_;
    std::unique_ptr<ILineWriter> writer_;
    const FileSink* file_sink_;  // owned by writer_, null for custom sinks
    std::string active_path_;
    std::atomic<LogLevel> level_;
};

// ===== template implementation =====

template <typename... Args>
std::error_code Logger::Logf(LogLevel level, fmt::format_string<Args...> fmt,
                             Args&&... args) {
    if (!ShouldLog(level)) {
        return {};
    }
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    return Dispatch(level, std::string_view(buf.data(), buf.size()));
}

template <typename... Args>
void Logger::Fatalf(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), fmt, std::forward<Args>(args)...);
    Fatal(std::string_view(buf.data(), buf.size()));
}

} // namespace rf_logger

// ===== Logging macros =====
// logger: anything dereferencing to rf_logger::Logger, e.g. a handle from
// LoggerRegistry or rf_logger::get_logger("app").

#define RF_LOG_CALL(logger, lvl, ...) \
    do { \
        constexpr auto _rf_lvl = ::rf_logger::LogLevel::lvl; \
        if (static_cast<int>(_rf_lvl) >= RF_LOG_ACTIVE_LEVEL) { \
            auto&& _rf_logger = (logger); \
            if (_rf_logger && _rf_logger->ShouldLog(_rf_lvl)) { \
                (void)_rf_logger->Logf(_rf_lvl, __VA_ARGS__); \
            } \
        } \
    } while (0)

#define RF_LOG_DEBUG(logger, ...) RF_LOG_CALL(logger, Debug, __VA_ARGS__)
#define RF_LOG_INFO(logger, ...)  RF_LOG_CALL(logger, Info,  __VA_ARGS__)
#define RF_LOG_WARN(logger, ...)  RF_LOG_CALL(logger, Warn,  __VA_ARGS__)
#define RF_LOG_ERROR(logger, ...) RF_LOG_CALL(logger, Error, __VA_ARGS__)

// Never filtered; does not return.
#define RF_LOG_FATAL(logger, ...) (logger)->Fatalf(__VA_ARGS__)

// Conditional logging
#define RF_LOG_WARN_IF(cond, logger, ...)  do { if (cond) RF_LOG_WARN(logger, __VA_ARGS__); } while(0)
#define RF_LOG_ERROR_IF(cond, logger, ...) do { if (cond) RF_LOG_ERROR(logger, __VA_ARGS__); } while(0)
