#include "rf_logger/logger.hpp"

#include <cstdio>
#include <cstdlib>

#include "rf_logger/async_writer.hpp"
#include "rf_logger/error.hpp"
#include "rf_logger/formatter.hpp"
#include "rf_logger/sinks/file_sink.hpp"
#include "rf_logger/sync_writer.hpp"
#include "rf_logger/thread_id.hpp"
#include "rf_logger/timestamp.hpp"

namespace rf_logger
{

namespace
{

constexpr std::string_view kFatalPrefix = "FATAL: ";

std::string render(LogLevel level, std::string_view message)
{
  LogRecord record{wall_clock_now_ns(), current_thread_id(), level, message};
  return format_line(record);
}

}  // namespace

std::shared_ptr<Logger> Logger::Create(const LogConfig& config, std::error_code& ec)
{
  ec = validate_config(config);
  if (ec)
  {
    return nullptr;
  }

  auto sink = std::make_unique<FileSink>(resolve_directory(config),
                                         normalize_file_name(config.file_name),
                                         config.max_file_size, config.max_files,
                                         config.instant_flush);
  ec = sink->Open();
  if (ec)
  {
    return nullptr;
  }

  const FileSink* observed = sink.get();
  std::string path = sink->ActivePath();
  return Build(config, std::move(sink), observed, std::move(path), ec);
}

std::shared_ptr<Logger> Logger::CreateWithSink(const LogConfig& config,
                                               std::unique_ptr<ILineSink> sink,
                                               std::error_code& ec)
{
  ec = validate_config(config);
  if (ec)
  {
    return nullptr;
  }
  if (!sink)
  {
    ec = LogErrc::kInvalidConfig;
    return nullptr;
  }
  return Build(config, std::move(sink), nullptr, std::string(), ec);
}

std::shared_ptr<Logger> Logger::Build(const LogConfig& config,
                                      std::unique_ptr<ILineSink> sink,
                                      const FileSink* file_sink, std::string active_path,
                                      std::error_code& ec)
{
  std::unique_ptr<ILineWriter> writer;
  if (config.async)
  {
    AsyncWriterOptions options;
    options.capacity = config.queue_capacity;
    options.overflow_policy = config.overflow_policy;
    options.enqueue_timeout = config.enqueue_timeout;
    options.flush_timeout = config.drain_timeout;

    auto async = std::make_unique<AsyncWriter>(std::move(sink), options);
    async->Start();
    writer = std::move(async);
  }
  else
  {
    writer = std::make_unique<SyncWriter>(std::move(sink));
  }

  ec.clear();
  // Constructor is private, so no make_shared.
  return std::shared_ptr<Logger>(
      new Logger(config, std::move(writer), file_sink, std::move(active_path)));
}

Logger::Logger(const LogConfig& config, std::unique_ptr<ILineWriter> writer,
               const FileSink* file_sink, std::string active_path)
    : config_(config),
      writer_(std::move(writer)),
      file_sink_(file_sink),
      active_path_(std::move(active_path)),
      level_(config.min_level)
{
}

Logger::~Logger() { Shutdown(); }

void Logger::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel Logger::Level() const { return level_.load(std::memory_order_relaxed); }

std::error_code Logger::Log(LogLevel level, std::string_view message)
{
  if (!ShouldLog(level))
  {
    return {};
  }
  return Dispatch(level, message);
}

std::error_code Logger::Dispatch(LogLevel level, std::string_view message)
{
  return writer_->Submit(render(level, message));
}

void Logger::Fatal(std::string_view message)
{
  std::string text;
  text.reserve(kFatalPrefix.size() + message.size());
  text.append(kFatalPrefix.data(), kFatalPrefix.size());
  text.append(message.data(), message.size());

  std::error_code ec =
      writer_->SubmitAndClose(render(LogLevel::Error, text), config_.fatal_drain_timeout);
  if (ec)
  {
    std::fprintf(stderr, "Logger[%s]: fatal message may not have reached disk: %s\n",
                 config_.instance_name.c_str(), ec.message().c_str());
  }
  std::exit(EXIT_FAILURE);
}

std::error_code Logger::Flush() { return writer_->Flush(); }

size_t Logger::Shutdown() { return writer_->Shutdown(config_.drain_timeout); }

LoggerStats Logger::Stats() const
{
  WriterStats ws = writer_->Stats();

  LoggerStats stats;
  stats.dropped = ws.dropped;
  stats.write_failures = ws.write_failures;
  stats.lost_on_shutdown = ws.lost_on_shutdown;
  if (file_sink_)
  {
    stats.rotations = file_sink_->RotationCount();
    stats.rotation_failures = file_sink_->RotationFailures();
  }
  return stats;
}

}  // namespace rf_logger
