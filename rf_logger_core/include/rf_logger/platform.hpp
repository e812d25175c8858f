#pragma once

// ===== 平台检测 =====
#if defined(__linux__)
    #define RF_LOG_PLATFORM_LINUX 1
#elif defined(__APPLE__)
    #define RF_LOG_PLATFORM_MACOS 1
#endif

// ===== 异步队列默认容量（行数） =====
#ifndef RF_LOG_DEFAULT_QUEUE_CAPACITY
    #define RF_LOG_DEFAULT_QUEUE_CAPACITY 8192
#endif

// ===== 文件轮转默认值 =====
#ifndef RF_LOG_DEFAULT_MAX_FILE_SIZE
    #define RF_LOG_DEFAULT_MAX_FILE_SIZE (20u * 1024u * 1024u)
#endif
#ifndef RF_LOG_DEFAULT_MAX_FILES
    #define RF_LOG_DEFAULT_MAX_FILES 5
#endif

// ===== 关闭时排空队列的超时（毫秒） =====
#ifndef RF_LOG_DEFAULT_DRAIN_TIMEOUT_MS
    #define RF_LOG_DEFAULT_DRAIN_TIMEOUT_MS 5000
#endif
#ifndef RF_LOG_DEFAULT_FATAL_DRAIN_TIMEOUT_MS
    #define RF_LOG_DEFAULT_FATAL_DRAIN_TIMEOUT_MS 1000
#endif

// ===== 编译信息注入（CMake 设置） =====
#ifndef RF_LOG_GIT_HASH
    #define RF_LOG_GIT_HASH "unknown"
#endif
#ifndef RF_LOG_BUILD_TYPE
    #define RF_LOG_BUILD_TYPE "unknown"
#endif
