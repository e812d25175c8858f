#pragma once
#include <functional>

#include "sink_interface.hpp"

namespace rf_logger
{

class CallbackSink : public ILineSink
{
 public:
  using Callback = std::function<std::error_code(std::string_view)>;

  explicit CallbackSink(Callback cb);

  std::error_code Write(std::string_view line) override;
  std::error_code Flush() override;

 private:
  Callback callback_;
};

}  // namespace rf_logger
