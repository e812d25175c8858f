#include "rf_logger/sinks/callback_sink.hpp"

namespace rf_logger {

CallbackSink::CallbackSink(Callback cb)
    : callback_(std::move(cb)) {}

std::error_code CallbackSink::Write(std::string_view line) {
    if (callback_) {
        return callback_(line);
    }
    return {};
}

std::error_code CallbackSink::Flush() {
    return {};
}

} // namespace rf_logger
