#pragma once
#include <cstdint>
#include <string_view>

#include "log_level.hpp"

namespace rf_logger {

struct LogRecord {
    uint64_t         wall_clock_ns;
    uint32_t         thread_id;
    LogLevel         level;
    std::string_view message;
};

} // namespace rf_logger
