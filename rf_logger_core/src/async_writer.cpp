#include "rf_logger/async_writer.hpp"

#include <cstdio>

#include "rf_logger/error.hpp"

namespace rf_logger {

AsyncWriter::AsyncWriter(std::unique_ptr<ILineSink> sink, const AsyncWriterOptions& options)
    : sink_(std::move(sink))
    , queue_(options.capacity)
    , options_(options) {}

AsyncWriter::~AsyncWriter() {
    Shutdown(options_.flush_timeout);
}

void AsyncWriter::Start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_ || shut_down_) {
        return;
    }
    worker_ = std::thread(&AsyncWriter::WorkerLoop, this);
    started_ = true;
}

std::error_code AsyncWriter::EnqueueLine(std::string line) {
    PushResult result = (options_.overflow_policy == OverflowPolicy::kBlock)
        ? queue_.PushFor(std::move(line), options_.enqueue_timeout)
        : queue_.TryPush(std::move(line));

    switch (result) {
        case PushResult::kOk:
            return {};
        case PushResult::kFull:
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return LogErrc::kQueueFull;
        case PushResult::kClosed:
            return LogErrc::kShutDown;
    }
    return LogErrc::kShutDown;
}

std::error_code AsyncWriter::Submit(std::string line) {
    return EnqueueLine(std::move(line));
}

void AsyncWriter::WriteOne(const std::string& line) {
    std::error_code ec;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        ec = sink_ ? sink_->Write(line) : make_error_code(LogErrc::kNotOpen);
    }
    // 调用方早已返回，写失败只能计数
    if (ec) {
        write_failures_.fetch_add(1, std::memory_order_relaxed);
    }
}

size_t AsyncWriter::Drain(size_t max_lines) {
    size_t count = 0;
    std::string line;
    while (count < max_lines && queue_.TryPop(line)) {
        WriteOne(line);
        queue_.TaskDone();
        ++count;
    }
    return count;
}

void AsyncWriter::WorkerLoop() {
    std::string line;
    while (queue_.WaitPop(line)) {
        WriteOne(line);
        queue_.TaskDone();
    }
}

std::error_code AsyncWriter::Flush() {
    bool threaded = false;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        threaded = started_ && !shut_down_;
    }
    if (threaded) {
        if (!queue_.WaitIdleFor(options_.flush_timeout)) {
            return std::make_error_code(std::errc::timed_out);
        }
    } else {
        while (Drain(64) > 0) {}
    }

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (!sink_) {
        return LogErrc::kNotOpen;
    }
    return sink_->Flush();
}

size_t AsyncWriter::Shutdown(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (shut_down_) {
        return 0;
    }
    shut_down_ = true;
    queue_.Close();

    size_t lost = 0;
    if (started_) {
        if (!queue_.WaitIdleFor(timeout)) {
            lost = queue_.Clear();
        }
        if (worker_.joinable()) {
            worker_.join();
        }
    } else {
        // 没有消费线程：在当前线程上排空，但同样受 timeout 约束
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (Drain(64) > 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                lost = queue_.Clear();
                break;
            }
        }
    }

    if (lost > 0) {
        lost_on_shutdown_.fetch_add(lost, std::memory_order_relaxed);
        std::fprintf(stderr, "AsyncWriter: drain timed out, %zu buffered lines lost\n", lost);
    }

    std::lock_guard<std::mutex> sink_lock(sink_mutex_);
    if (sink_) {
        // 释放文件，同一路径可被重新打开
        std::error_code ec = sink_->Close();
        if (ec && ec != LogErrc::kNotOpen) {
            std::fprintf(stderr, "AsyncWriter: close on shutdown failed: %s\n",
                         ec.message().c_str());
        }
    }
    return lost;
}

std::error_code AsyncWriter::SubmitAndClose(std::string line,
                                            std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    std::error_code ec;
    switch (queue_.PushFor(std::move(line), timeout)) {
        case PushResult::kOk:
            break;
        case PushResult::kFull:
            dropped_.fetch_add(1, std::memory_order_relaxed);
            ec = LogErrc::kQueueFull;
            break;
        case PushResult::kClosed:
            ec = LogErrc::kShutDown;
            break;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    Shutdown(elapsed < timeout ? timeout - elapsed : std::chrono::milliseconds(0));
    return ec;
}

WriterStats AsyncWriter::Stats() const {
    WriterStats stats;
    stats.dropped = dropped_.load(std::memory_order_relaxed);
    stats.write_failures = write_failures_.load(std::memory_order_relaxed);
    stats.lost_on_shutdown = lost_on_shutdown_.load(std::memory_order_relaxed);
    return stats;
}

} // namespace rf_logger
