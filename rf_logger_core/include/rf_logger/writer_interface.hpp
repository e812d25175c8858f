#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace rf_logger
{

struct WriterStats
{
  uint64_t dropped = 0;           // rejected by a full queue
  uint64_t write_failures = 0;    // I/O errors swallowed by the consumer
  uint64_t lost_on_shutdown = 0;  // still queued when the drain timed out
};

// Delivers rendered lines to a sink: directly under a lock (SyncWriter) or
// through a queue and a consumer thread (AsyncWriter).
class ILineWriter
{
 public:
  virtual ~ILineWriter() = default;

  virtual std::error_code Submit(std::string line) = 0;

  virtual std::error_code Flush() = 0;

  // 停止接收新行；异步模式下在 timeout 内排空队列，返回丢失的行数
  virtual size_t Shutdown(std::chrono::milliseconds timeout) = 0;

  // Last line before the process goes away: delivered regardless of the
  // overflow policy (waiting up to timeout for queue space), then Shutdown.
  virtual std::error_code SubmitAndClose(std::string line, std::chrono::milliseconds timeout) = 0;

  virtual WriterStats Stats() const = 0;
};

}  // namespace rf_logger
