#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace skya {

// Bounded single-producer queue of status snapshots.
//
// offer() never blocks: when the queue is full the snapshot is dropped and
// the producer carries on. close() always enqueues its final value, evicting
// the oldest pending snapshot if it has to, so a consumer that drains until
// pop() returns nullopt is guaranteed to see the terminal state last.
template <typename T>
class ProgressChannel {
public:
  explicit ProgressChannel(size_t capacity = 100) : capacity_(capacity ? capacity : 1) {}

  ProgressChannel(const ProgressChannel&) = delete;
  ProgressChannel& operator=(const ProgressChannel&) = delete;

  bool offer(T value) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_ || queue_.size() >= capacity_) {
        ++dropped_;
        return false;
      }
      queue_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  void close(T finalValue) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return;
      if (queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
      }
      queue_.push_back(std::move(finalValue));
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Blocks until a value is available; nullopt once closed and drained.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [&] { return !queue_.empty() || closed_; });
    return takeLocked();
  }

  // Like pop() but gives up after `timeout`, returning nullopt.
  template <typename Rep, typename Period>
  std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [&] { return !queue_.empty() || closed_; });
    return takeLocked();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
  }

  size_t dropped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
  }

private:
  std::optional<T> takeLocked() {
    if (queue_.empty()) return std::nullopt;
    T v = std::move(queue_.front());
    queue_.pop_front();
    return v;
  }

  const size_t            capacity_;
  mutable std::mutex      mu_;
  std::condition_variable cv_;
  std::deque<T>           queue_;
  bool                    closed_ = false;
  size_t                  dropped_ = 0;
};

} // namespace skya
