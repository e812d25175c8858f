#pragma once
#include <cstddef>
#include <cstdint>

namespace rf_logger
{

uint64_t wall_clock_now_ns();

// "YYYY-MM-DD HH:MM:SS.mmm" in local time
size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size);

constexpr size_t kTimestampLength = 23;

}  // namespace rf_logger
