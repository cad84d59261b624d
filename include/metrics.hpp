#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct StatSnapshot {
  double loop_p50{0}, loop_p95{0}, loop_p99{0};
  double overrun_rate{0};
  double fps{0};
  uint64_t iterations{0};
  uint64_t frames_submitted{0}, frames_dropped{0};
  uint64_t samples_processed{0};
  uint64_t payloads_emitted{0}, payloads_dropped{0};
};

// Control-loop timings and pipeline counters. Every method is thread-safe.
class MetricsRegistry {
public:
  void add_loop(double ms) { loop_.add(ms); }

  void inc_iteration() { iterations_.fetch_add(1, std::memory_order_relaxed); }
  void inc_overrun() { overruns_.fetch_add(1, std::memory_order_relaxed); }
  void inc_submitted() { frames_submitted_.fetch_add(1, std::memory_order_relaxed); }
  void inc_frame_dropped() { frames_dropped_.fetch_add(1, std::memory_order_relaxed); }
  void inc_sample() { samples_processed_.fetch_add(1, std::memory_order_relaxed); }
  void inc_emitted() { payloads_emitted_.fetch_add(1, std::memory_order_relaxed); }
  void inc_payload_dropped() { payloads_dropped_.fetch_add(1, std::memory_order_relaxed); }

  uint64_t iterations() const { return iterations_.load(std::memory_order_relaxed); }
  uint64_t overruns() const { return overruns_.load(std::memory_order_relaxed); }
  uint64_t payloads_emitted() const { return payloads_emitted_.load(std::memory_order_relaxed); }

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  RollingHist loop_;
  std::atomic<uint64_t> iterations_{0};
  std::atomic<uint64_t> overruns_{0};
  std::atomic<uint64_t> frames_submitted_{0};
  std::atomic<uint64_t> frames_dropped_{0};
  std::atomic<uint64_t> samples_processed_{0};
  std::atomic<uint64_t> payloads_emitted_{0};
  std::atomic<uint64_t> payloads_dropped_{0};
};
