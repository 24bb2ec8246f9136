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

struct CaptureStats {
  double capture_p50{0}, capture_p95{0}, capture_p99{0};
  uint64_t shots_total{0};
  uint64_t failures_total{0};
  uint64_t runs_total{0};
  double failure_rate{0};
};

// Capture latency and outcome counters across every run of the session.
class CaptureMetrics {
public:
  void add_capture(double seconds, bool success) {
    capture_ms_.add(seconds * 1000.0);
    shots_total_.fetch_add(1, std::memory_order_relaxed);
    if (!success) failures_total_.fetch_add(1, std::memory_order_relaxed);
  }
  void inc_run() { runs_total_.fetch_add(1, std::memory_order_relaxed); }

  uint64_t shots_total() const { return shots_total_.load(std::memory_order_relaxed); }
  uint64_t failures_total() const { return failures_total_.load(std::memory_order_relaxed); }

  CaptureStats snapshot() const;
  std::string prometheus_text(const CaptureStats& s) const;

private:
  RollingHist capture_ms_;
  std::atomic<uint64_t> shots_total_{0};
  std::atomic<uint64_t> failures_total_{0};
  std::atomic<uint64_t> runs_total_{0};
};
