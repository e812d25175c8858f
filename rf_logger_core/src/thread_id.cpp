#include "rf_logger/thread_id.hpp"

#include <functional>
#include <thread>

namespace rf_logger
{

namespace
{

thread_local uint32_t tls_thread_id = 0;
thread_local bool tls_thread_id_cached = false;

}  // namespace

uint32_t current_thread_id()
{
  if (!tls_thread_id_cached)
  {
    size_t h = std::hash<std::thread::id>{}(std::this_thread::get_id());
    tls_thread_id = static_cast<uint32_t>(h % kThreadIdModulus);
    tls_thread_id_cached = true;
  }
  return tls_thread_id;
}

}  // namespace rf_logger
