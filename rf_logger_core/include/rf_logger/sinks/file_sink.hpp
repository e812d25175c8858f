#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "sink_interface.hpp"

namespace rf_logger
{

class FileSink : public ILineSink
{
 public:
  // directory: created (mkdir -p) by Open()
  // file_name: stem without extension, e.g. "app" -> app.log, app.1.log, ...
  // max_file_size: soft threshold checked before each write
  // max_files: number of backups kept (e.g. 3 means app.1.log .. app.3.log)
  FileSink(const std::string& directory, const std::string& file_name,
           size_t max_file_size, size_t max_files = 5, bool instant_flush = false);
  ~FileSink() override;

  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;

  // Fails with kPathInUse while another open FileSink in this process owns
  // the same active file, however its directory was spelled.
  std::error_code Open();

  std::error_code Write(std::string_view line) override;
  std::error_code Flush() override;
  // fsync, close and give up ownership of the active file.
  std::error_code Close() override;

  bool IsOpen() const { return fd_ >= 0; }
  size_t CurrentSize() const { return current_size_; }
  const std::string& ActivePath() const { return active_path_; }
  uint64_t RotationCount() const { return rotation_count_.load(std::memory_order_relaxed); }
  uint64_t RotationFailures() const
  {
    return rotation_failures_.load(std::memory_order_relaxed);
  }

 private:
  std::string directory_;
  std::string file_name_;
  std::string stem_;
  std::string active_path_;
  size_t max_file_size_;
  size_t max_files_;
  bool instant_flush_;
  size_t current_size_;
  // After a failed rotation, no retry until the file reaches this size.
  size_t retry_rotation_at_;
  // Read from other threads for stats.
  std::atomic<uint64_t> rotation_count_;
  std::atomic<uint64_t> rotation_failures_;
  int fd_;
  bool owns_path_;
  // (st_dev, st_ino) of the directory the active file lives in.
  uint64_t dir_dev_;
  uint64_t dir_ino_;

  int OpenActive(std::error_code& ec);
  void Rotate();
  std::error_code WriteAll(std::string_view line);

  bool ClaimPath();
  void ReleasePath();

  static std::error_code MkdirRecursive(const std::string& path);
};

}  // namespace rf_logger
