#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "bounded_queue.hpp"
#include "log_config.hpp"
#include "sinks/sink_interface.hpp"
#include "writer_interface.hpp"

namespace rf_logger
{

struct AsyncWriterOptions
{
  size_t capacity = RF_LOG_DEFAULT_QUEUE_CAPACITY;
  OverflowPolicy overflow_policy = OverflowPolicy::kDropNewest;
  std::chrono::milliseconds enqueue_timeout{10};
  std::chrono::milliseconds flush_timeout{RF_LOG_DEFAULT_DRAIN_TIMEOUT_MS};
};

class AsyncWriter : public ILineWriter
{
 public:
  AsyncWriter(std::unique_ptr<ILineSink> sink, const AsyncWriterOptions& options);
  ~AsyncWriter() override;

  AsyncWriter(const AsyncWriter&) = delete;
  AsyncWriter& operator=(const AsyncWriter&) = delete;

  // 启动后端消费线程
  void Start();

  // 生产者调用（业务线程）；队列满时按 overflow_policy 处理
  std::error_code EnqueueLine(std::string line);

  // 无线程模式：在调用线程上写出最多 max_lines 行
  size_t Drain(size_t max_lines = 64);

  std::error_code Submit(std::string line) override;
  std::error_code Flush() override;
  size_t Shutdown(std::chrono::milliseconds timeout) override;
  std::error_code SubmitAndClose(std::string line, std::chrono::milliseconds timeout) override;
  WriterStats Stats() const override;

  size_t Pending() const { return queue_.Size(); }
  uint64_t DroppedCount() const { return dropped_.load(std::memory_order_relaxed); }

 private:
  std::unique_ptr<ILineSink> sink_;
  // Held by whoever touches the sink: the consumer per line, Flush/Shutdown
  // while the consumer is idle or gone.
  std::mutex sink_mutex_;
  BoundedQueue<std::string> queue_;
  AsyncWriterOptions options_;

  std::mutex lifecycle_mutex_;
  std::thread worker_;
  bool started_ = false;
  bool shut_down_ = false;

  std::atomic<uint64_t> dropped_{0};
  std::atomic<uint64_t> write_failures_{0};
  std::atomic<uint64_t> lost_on_shutdown_{0};

  void WorkerLoop();
  void WriteOne(const std::string& line);
};

}  // namespace rf_logger
