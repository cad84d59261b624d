#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

// Fixed-capacity FIFO. Producers never block: try_push() fails when full.
// Consumers wait with a timeout so they can observe their own stop flag.
template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity) : cap_(capacity) {
    if (cap_ == 0) throw std::invalid_argument("BoundedQueue capacity must be > 0");
  }

  bool try_push(T item) {
    {
      std::lock_guard<std::mutex> g(mu_);
      if (closed_ || items_.size() >= cap_) return false;
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return std::nullopt;
    T out = std::move(items_.front());
    items_.pop_front();
    return out;
  }

  // Wakes every waiting consumer; later pushes fail until reopen().
  void close() {
    {
      std::lock_guard<std::mutex> g(mu_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  void reopen() {
    std::lock_guard<std::mutex> g(mu_);
    closed_ = false;
  }

  void clear() {
    std::lock_guard<std::mutex> g(mu_);
    items_.clear();
  }

  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return items_.size();
  }

  bool closed() const {
    std::lock_guard<std::mutex> g(mu_);
    return closed_;
  }

  size_t capacity() const { return cap_; }

private:
  const size_t cap_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_{false};
};
