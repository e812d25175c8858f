#pragma once
#include <memory>
#include <mutex>

#include "sinks/sink_interface.hpp"
#include "writer_interface.hpp"

namespace rf_logger
{

class SyncWriter : public ILineWriter
{
 public:
  explicit SyncWriter(std::unique_ptr<ILineSink> sink);
  ~SyncWriter() override;

  // Blocks while another thread holds the sink; I/O errors are returned.
  std::error_code WriteLine(std::string_view line);

  std::error_code Submit(std::string line) override;
  std::error_code Flush() override;
  size_t Shutdown(std::chrono::milliseconds timeout) override;
  std::error_code SubmitAndClose(std::string line, std::chrono::milliseconds timeout) override;
  WriterStats Stats() const override;

 private:
  mutable std::mutex mutex_;
  std::unique_ptr<ILineSink> sink_;
  bool shut_down_ = false;
};

}  // namespace rf_logger
