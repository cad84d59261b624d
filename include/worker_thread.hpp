#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <mutex>
#include <thread>

// Owned background thread with a cooperative stop flag.
// request_stop() and join*() are idempotent, safe before start() and from
// several threads at once. The body polls stop_requested().
class WorkerThread {
public:
  WorkerThread() = default;
  ~WorkerThread() {
    request_stop();
    join();
  }

  WorkerThread(const WorkerThread&) = delete;
  WorkerThread& operator=(const WorkerThread&) = delete;

  // Returns false if a previous run has not been joined yet. The body must
  // not throw: an escaping exception terminates the process.
  bool start(std::function<void()> body) {
    std::lock_guard<std::mutex> g(mu_);
    if (thread_.joinable()) return false;
    stop_.store(false);
    std::promise<void> exited;
    exited_ = exited.get_future();
    thread_ = std::thread([body = std::move(body), exited = std::move(exited)]() mutable {
      body();
      exited.set_value();
    });
    return true;
  }

  void request_stop() { stop_.store(true); }
  bool stop_requested() const { return stop_.load(); }

  bool running() const {
    std::lock_guard<std::mutex> g(mu_);
    return thread_.joinable() &&
           exited_.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
  }

  // Joins if the body exits within `timeout`; otherwise leaves the thread
  // running and returns false.
  bool join_for(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> g(mu_);
    if (!thread_.joinable()) return true;
    if (thread_.get_id() == std::this_thread::get_id()) return false;
    if (exited_.wait_for(timeout) != std::future_status::ready) return false;
    thread_.join();
    return true;
  }

  void join() {
    std::lock_guard<std::mutex> g(mu_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
  }

private:
  mutable std::mutex mu_;
  std::thread thread_;
  std::future<void> exited_;
  std::atomic<bool> stop_{false};
};
