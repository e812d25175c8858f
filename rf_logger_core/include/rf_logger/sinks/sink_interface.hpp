#pragma once
#include <string_view>
#include <system_error>

namespace rf_logger
{

class ILineSink
{
 public:
  virtual ~ILineSink() = default;

  // 写入一行（不含换行符），由持有者串行调用
  virtual std::error_code Write(std::string_view line) = 0;

  // 刷新到持久存储
  virtual std::error_code Flush() = 0;

  // 最终关闭；之后不再调用 Write
  virtual std::error_code Close() { return Flush(); }
};

}  // namespace rf_logger
