#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rf_logger {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3
};

constexpr std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// 写入文件时的级别字段：小写，左对齐，定宽 5
constexpr std::string_view to_padded_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info ";
        case LogLevel::Warn:  return "warn ";
        case LogLevel::Error: return "error";
    }
    return "?????";
}

constexpr size_t kLevelFieldWidth = 5;

// 编译期最低活跃级别（通过 CMake -DRF_LOG_ACTIVE_LEVEL=1 注入）
#ifndef RF_LOG_ACTIVE_LEVEL
    #ifdef NDEBUG
        #define RF_LOG_ACTIVE_LEVEL 1  // Info
    #else
        #define RF_LOG_ACTIVE_LEVEL 0  // Debug
    #endif
#endif

} // namespace rf_logger
