#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <utility>
#include <vector>

namespace rf_logger
{

enum class PushResult : uint8_t
{
  kOk,
  kFull,
  kClosed
};

// Fixed-capacity MPSC FIFO. Producers never wait unless they ask to (PushFor);
// the consumer sleeps in WaitPop until an item arrives or the queue closes.
// Every popped item must be acknowledged with TaskDone() so WaitIdleFor can
// tell "queue empty" apart from "last item still being written".
template <typename T>
class BoundedQueue
{
 public:
  explicit BoundedQueue(size_t capacity)
      : buffer_(capacity > 0 ? capacity : 1), capacity_(buffer_.size())
  {
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  PushResult TryPush(T item)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return PushResult::kClosed;
      if (count_ == capacity_) return PushResult::kFull;
      PushLocked(std::move(item));
    }
    not_empty_.notify_one();
    return PushResult::kOk;
  }

  template <typename Rep, typename Period>
  PushResult PushFor(T item, const std::chrono::duration<Rep, Period>& timeout)
  {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      bool ready = not_full_.wait_for(lock, timeout,
                                      [this] { return closed_ || count_ < capacity_; });
      if (closed_) return PushResult::kClosed;
      if (!ready) return PushResult::kFull;
      PushLocked(std::move(item));
    }
    not_empty_.notify_one();
    return PushResult::kOk;
  }

  bool TryPop(T& item)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (count_ == 0) return false;
      PopLocked(item);
    }
    not_full_.notify_one();
    return true;
  }

  // Returns false once the queue is closed and empty.
  bool WaitPop(T& item)
  {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      not_empty_.wait(lock, [this] { return count_ > 0 || closed_; });
      if (count_ == 0) return false;
      PopLocked(item);
    }
    not_full_.notify_one();
    return true;
  }

  void TaskDone()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unfinished_ > 0) --unfinished_;
    if (unfinished_ == 0) idle_.notify_all();
  }

  // Waits until every pushed item has been popped and acknowledged.
  template <typename Rep, typename Period>
  bool WaitIdleFor(const std::chrono::duration<Rep, Period>& timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return unfinished_ == 0; });
  }

  // Rejects further pushes; pending items stay poppable.
  void Close()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Discards pending items and returns how many were dropped.
  size_t Clear()
  {
    size_t dropped = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      dropped = count_;
      for (size_t i = 0; i < count_; ++i)
      {
        buffer_[(head_ + i) % capacity_] = T();
      }
      head_ = 0;
      count_ = 0;
      unfinished_ -= dropped;
      if (unfinished_ == 0) idle_.notify_all();
    }
    not_full_.notify_all();
    return dropped;
  }

  bool Closed() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t Size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
  }

  bool Empty() const { return Size() == 0; }

  size_t GetCapacity() const { return capacity_; }

 private:
  void PushLocked(T&& item)
  {
    buffer_[(head_ + count_) % capacity_] = std::move(item);
    ++count_;
    ++unfinished_;
  }

  void PopLocked(T& item)
  {
    item = std::move(buffer_[head_]);
    buffer_[head_] = T();
    head_ = (head_ + 1) % capacity_;
    --count_;
  }

  std::vector<T> buffer_;
  const size_t capacity_;
  size_t head_ = 0;
  size_t count_ = 0;
  size_t unfinished_ = 0;
  bool closed_ = false;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::condition_variable idle_;
};

}  // namespace rf_logger
