#include "rf_logger/sync_writer.hpp"

#include <cstdio>

#include "rf_logger/error.hpp"

namespace rf_logger
{

SyncWriter::SyncWriter(std::unique_ptr<ILineSink> sink) : sink_(std::move(sink)) {}

SyncWriter::~SyncWriter() { Shutdown(std::chrono::milliseconds(0)); }

std::error_code SyncWriter::WriteLine(std::string_view line)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_ || !sink_)
  {
    return LogErrc::kShutDown;
  }
  return sink_->Write(line);
}

std::error_code SyncWriter::Submit(std::string line) { return WriteLine(line); }

std::error_code SyncWriter::Flush()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_ || !sink_)
  {
    return LogErrc::kShutDown;
  }
  return sink_->Flush();
}

size_t SyncWriter::Shutdown(std::chrono::milliseconds /*timeout*/)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (shut_down_)
  {
    return 0;
  }
  shut_down_ = true;
  if (sink_)
  {
    std::error_code ec = sink_->Close();
    if (ec && ec != make_error_code(LogErrc::kNotOpen))
    {
      std::fprintf(stderr, "SyncWriter: close on shutdown failed: %s\n", ec.message().c_str());
    }
  }
  return 0;
}

std::error_code SyncWriter::SubmitAndClose(std::string line, std::chrono::milliseconds timeout)
{
  std::error_code ec = WriteLine(line);
  Shutdown(timeout);
  return ec;
}

WriterStats SyncWriter::Stats() const { return {}; }

}  // namespace rf_logger
