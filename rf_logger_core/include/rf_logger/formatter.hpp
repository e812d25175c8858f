#pragma once
#include <string>

#include "log_record.hpp"

namespace rf_logger
{

// Renders "YYYY-MM-DD HH:MM:SS.mmm [LEVEL][TTTT] MESSAGE" without the trailing
// newline. The file sink owns the line terminator.
std::string format_line(const LogRecord& record);

// Appends the rendered line to out; lets callers reuse one buffer.
void format_line_to(const LogRecord& record, std::string& out);

// Length of everything before the message text.
constexpr size_t kLinePrefixLength = 23 + 2 + 5 + 2 + 4 + 2;

}  // namespace rf_logger
