#include "rf_logger/formatter.hpp"

#include <fmt/format.h>

#include <iterator>

#include "rf_logger/thread_id.hpp"
#include "rf_logger/timestamp.hpp"

namespace rf_logger
{

void format_line_to(const LogRecord& record, std::string& out)
{
  char ts[32];
  size_t ts_len = format_timestamp(record.wall_clock_ns, ts, sizeof(ts));

  out.reserve(out.size() + kLinePrefixLength + record.message.size());
  fmt::format_to(std::back_inserter(out), "{} [{}][{:0{}}] {}",
                 std::string_view(ts, ts_len), to_padded_string(record.level),
                 record.thread_id % kThreadIdModulus, kThreadIdWidth, record.message);
}

std::string format_line(const LogRecord& record)
{
  std::string out;
  format_line_to(record, out);
  return out;
}

}  // namespace rf_logger
