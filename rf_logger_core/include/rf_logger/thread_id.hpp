#pragma once
#include <cstdint>

namespace rf_logger
{

// Stable per-thread value in [0, kThreadIdModulus), cached in TLS.
uint32_t current_thread_id();

constexpr uint32_t kThreadIdModulus = 10000;
constexpr int kThreadIdWidth = 4;

}  // namespace rf_logger
