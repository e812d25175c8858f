#include "rf_logger/sinks/file_sink.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/uio.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <set>
#include <tuple>

#include "rf_logger/error.hpp"
#include "rf_logger/rotation_policy.hpp"

namespace rf_logger
{

namespace
{

std::error_code last_os_error() { return {errno, std::system_category()}; }

// Active files owned by open sinks: (directory dev, directory inode, file name).
// Keyed on the directory identity so "d", "d/." and symlinks to d collide.
using PathKey = std::tuple<uint64_t, uint64_t, std::string>;

std::mutex& owned_paths_mutex()
{
  static std::mutex mutex;
  return mutex;
}

std::set<PathKey>& owned_paths()
{
  static std::set<PathKey> paths;
  return paths;
}

}  // namespace

std::error_code FileSink::MkdirRecursive(const std::string& path)
{
  int mkdir_errno = 0;
  std::string tmp;
  for (size_t i = 0; i < path.size(); ++i)
  {
    tmp += path[i];
    if (path[i] == '/' || i == path.size() - 1)
    {
      if (tmp == "/") continue;
      if (::mkdir(tmp.c_str(), 0755) != 0 && errno != EEXIST)
      {
        mkdir_errno = errno;
      }
    }
  }

  struct stat st{};
  if (::stat(path.c_str(), &st) != 0)
  {
    return {mkdir_errno != 0 ? mkdir_errno : errno, std::system_category()};
  }
  if (!S_ISDIR(st.st_mode))
  {
    return std::make_error_code(std::errc::not_a_directory);
  }
  if (::access(path.c_str(), W_OK | X_OK) != 0)
  {
    return last_os_error();
  }
  return {};
}

FileSink::FileSink(const std::string& directory, const std::string& file_name,
                   size_t max_file_size, size_t max_files, bool instant_flush)
    : directory_(directory),
      file_name_(file_name),
      max_file_size_(max_file_size),
      max_files_(max_files),
      instant_flush_(instant_flush),
      current_size_(0),
      retry_rotation_at_(0),
      rotation_count_(0),
      rotation_failures_(0),
      fd_(-1),
      owns_path_(false),
      dir_dev_(0),
      dir_ino_(0)
{
  stem_ = directory_;
  if (!stem_.empty() && stem_.back() != '/')
  {
    stem_ += '/';
  }
  stem_ += file_name_;
  active_path_ = active_path(stem_);
}

FileSink::~FileSink()
{
  std::error_code ec = Close();
  if (ec && ec != LogErrc::kNotOpen)
  {
    std::fprintf(stderr, "FileSink: close of '%s' failed: %s\n", active_path_.c_str(),
                 ec.message().c_str());
  }
}

bool FileSink::ClaimPath()
{
  std::lock_guard<std::mutex> lock(owned_paths_mutex());
  owns_path_ = owned_paths().emplace(dir_dev_, dir_ino_, file_name_).second;
  return owns_path_;
}

void FileSink::ReleasePath()
{
  if (!owns_path_) return;
  std::lock_guard<std::mutex> lock(owned_paths_mutex());
  owned_paths().erase(PathKey(dir_dev_, dir_ino_, file_name_));
  owns_path_ = false;
}

int FileSink::OpenActive(std::error_code& ec)
{
  int fd = ::open(active_path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0)
  {
    ec = last_os_error();
  }
  return fd;
}

std::error_code FileSink::Open()
{
  if (fd_ >= 0)
  {
    return {};
  }

  std::error_code ec = MkdirRecursive(directory_);
  if (ec)
  {
    std::fprintf(stderr, "FileSink: cannot use directory '%s': %s\n", directory_.c_str(),
                 ec.message().c_str());
    return LogErrc::kDirectoryUnavailable;
  }

  struct stat dir_st{};
  if (::stat(directory_.c_str(), &dir_st) != 0)
  {
    ec = last_os_error();
    std::fprintf(stderr, "FileSink: cannot stat directory '%s': %s\n", directory_.c_str(),
                 ec.message().c_str());
    return LogErrc::kDirectoryUnavailable;
  }
  dir_dev_ = static_cast<uint64_t>(dir_st.st_dev);
  dir_ino_ = static_cast<uint64_t>(dir_st.st_ino);

  if (!ClaimPath())
  {
    std::fprintf(stderr, "FileSink: '%s' is already open in this process\n",
                 active_path_.c_str());
    return LogErrc::kPathInUse;
  }

  fd_ = OpenActive(ec);
  if (fd_ < 0)
  {
    ReleasePath();
    std::fprintf(stderr, "FileSink: failed to open '%s': %s\n", active_path_.c_str(),
                 ec.message().c_str());
    return ec;
  }

  struct stat st{};
  if (::fstat(fd_, &st) == 0)
  {
    current_size_ = static_cast<size_t>(st.st_size);
  }
  else
  {
    current_size_ = 0;
  }
  retry_rotation_at_ = 0;
  return {};
}

void FileSink::Rotate()
{
  auto fail = [this]()
  {
    rotation_failures_.fetch_add(1, std::memory_order_relaxed);
    retry_rotation_at_ = current_size_ + max_file_size_;
  };

  RotationPlan plan = plan_rotation(stem_, list_backups(directory_, file_name_), max_files_);

  for (const auto& path : plan.removals)
  {
    if (::unlink(path.c_str()) != 0 && errno != ENOENT)
    {
      std::fprintf(stderr, "FileSink: failed to remove '%s': %s\n", path.c_str(),
                   std::strerror(errno));
    }
  }

  // Stop at the first failed backup rename: continuing would overwrite the
  // file that could not be moved.
  for (size_t i = 0; i + 1 < plan.renames.size(); ++i)
  {
    const RenameOp& op = plan.renames[i];
    if (::rename(op.from.c_str(), op.to.c_str()) != 0)
    {
      std::fprintf(stderr, "FileSink: failed to rename '%s' -> '%s': %s\n", op.from.c_str(),
                   op.to.c_str(), std::strerror(errno));
      fail();
      return;
    }
  }

  if (plan.renames.empty())
  {
    fail();
    return;
  }

  if (::fdatasync(fd_) != 0)
  {
    std::fprintf(stderr, "FileSink: fdatasync before rotation failed on '%s': %s\n",
                 active_path_.c_str(), std::strerror(errno));
  }

  const RenameOp& active = plan.renames.back();
  if (::rename(active.from.c_str(), active.to.c_str()) != 0)
  {
    std::fprintf(stderr, "FileSink: failed to rename '%s' -> '%s': %s\n",
                 active.from.c_str(), active.to.c_str(), std::strerror(errno));
    fail();
    return;
  }

  std::error_code ec;
  int new_fd = OpenActive(ec);
  if (new_fd < 0)
  {
    std::fprintf(stderr, "FileSink: failed to reopen '%s' after rotation: %s\n",
                 active_path_.c_str(), ec.message().c_str());
    // The old descriptor still points at the renamed file; move it back so
    // the active name keeps matching what we write to.
    if (::rename(active.to.c_str(), active.from.c_str()) != 0)
    {
      std::fprintf(stderr, "FileSink: failed to restore '%s': %s\n", active.from.c_str(),
                   std::strerror(errno));
    }
    fail();
    return;
  }

  ::close(fd_);
  fd_ = new_fd;

  struct stat st{};
  current_size_ = (::fstat(fd_, &st) == 0) ? static_cast<size_t>(st.st_size) : 0;
  retry_rotation_at_ = 0;
  rotation_count_.fetch_add(1, std::memory_order_relaxed);
}

std::error_code FileSink::WriteAll(std::string_view line)
{
  static const char kNewline = '\n';

  struct iovec iov[2];
  iov[0].iov_base = const_cast<char*>(line.data());
  iov[0].iov_len = line.size();
  iov[1].iov_base = const_cast<char*>(&kNewline);
  iov[1].iov_len = 1;

  struct iovec* cur = iov;
  int iovcnt = 2;
  while (iovcnt > 0)
  {
    ssize_t written = ::writev(fd_, cur, iovcnt);
    if (written < 0)
    {
      if (errno == EINTR) continue;
      return last_os_error();
    }
    if (written == 0)
    {
      return std::make_error_code(std::errc::io_error);
    }

    current_size_ += static_cast<size_t>(written);
    size_t left = static_cast<size_t>(written);
    while (iovcnt > 0 && left >= cur->iov_len)
    {
      left -= cur->iov_len;
      ++cur;
      --iovcnt;
    }
    if (iovcnt > 0)
    {
      cur->iov_base = static_cast<char*>(cur->iov_base) + left;
      cur->iov_len -= left;
    }
  }
  return {};
}

std::error_code FileSink::Write(std::string_view line)
{
  if (fd_ < 0)
  {
    return LogErrc::kNotOpen;
  }

  // An empty file is never rotated, so an oversized line lands whole in it.
  if (current_size_ > 0 && current_size_ >= retry_rotation_at_ &&
      should_rotate(current_size_, line.size() + 1, max_file_size_))
  {
    Rotate();
  }

  std::error_code ec = WriteAll(line);
  if (ec)
  {
    return ec;
  }

  if (instant_flush_ && ::fdatasync(fd_) != 0)
  {
    return last_os_error();
  }
  return {};
}

std::error_code FileSink::Close()
{
  if (fd_ < 0)
  {
    return LogErrc::kNotOpen;
  }

  std::error_code ec;
  if (::fsync(fd_) != 0)
  {
    ec = last_os_error();
  }
  if (::close(fd_) != 0 && !ec)
  {
    ec = last_os_error();
  }
  fd_ = -1;
  ReleasePath();
  return ec;
}

std::error_code FileSink::Flush()
{
  if (fd_ < 0)
  {
    return LogErrc::kNotOpen;
  }
  if (::fdatasync(fd_) != 0)
  {
    return last_os_error();
  }
  return {};
}

}  // namespace rf_logger
