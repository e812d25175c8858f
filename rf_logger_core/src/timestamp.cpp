#include "rf_logger/timestamp.hpp"

#include <time.h>

#include <cstdio>

#include "rf_logger/platform.hpp"

#if !defined(RF_LOG_PLATFORM_LINUX) && !defined(RF_LOG_PLATFORM_MACOS)
#include <chrono>
#endif

namespace rf_logger
{

namespace
{

constexpr uint64_t kNsPerSec = 1'000'000'000ULL;
constexpr uint64_t kNsPerMs = 1'000'000ULL;

}  // namespace

uint64_t wall_clock_now_ns()
{
#if defined(RF_LOG_PLATFORM_LINUX) || defined(RF_LOG_PLATFORM_MACOS)
  struct timespec ts;
  ::clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * kNsPerSec + static_cast<uint64_t>(ts.tv_nsec);
#else
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
#endif
}

size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;

  // Milliseconds are truncated, never rounded up into the next second.
  time_t sec = static_cast<time_t>(wall_ns / kNsPerSec);
  unsigned ms = static_cast<unsigned>((wall_ns % kNsPerSec) / kNsPerMs);

  struct tm local{};
  ::localtime_r(&sec, &local);

  int n = std::snprintf(buf, buf_size, "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                        local.tm_year + 1900, local.tm_mon + 1, local.tm_mday, local.tm_hour,
                        local.tm_min, local.tm_sec, ms);
  if (n < 0) return 0;
  return static_cast<size_t>(n) < buf_size ? static_cast<size_t>(n) : buf_size - 1;
}

}  // namespace rf_logger
