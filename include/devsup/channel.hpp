#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace devsup {

// Unbounded multi-producer / single-consumer queue.
template <typename T> class Channel {
public:
  void send(T v) {
    {
      std::lock_guard<std::mutex> lk(m_);
      if (closed_)
        return;
      q_.push_back(std::move(v));
    }
    cv_.notify_one();
  }

  // Empty when nothing arrived within `timeout` or the channel was closed
  // and drained.
  template <typename Rep, typename Period>
  std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait_for(lk, timeout, [&] { return !q_.empty() || closed_; });
    if (q_.empty())
      return std::nullopt;
    T v = std::move(q_.front());
    q_.pop_front();
    return v;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lk(m_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lk(m_);
    return closed_;
  }

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::deque<T> q_;
  bool closed_ = false;
};

// One-shot cancellation flag whose waits wake up early on cancel().
class Cancellation {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lk(m_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lk(m_);
    return cancelled_;
  }

  // Returns true if cancelled before the timeout expired.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lk(m_);
    return cv_.wait_for(lk, timeout, [&] { return cancelled_; });
  }

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  bool cancelled_ = false;
};

} // namespace devsup
