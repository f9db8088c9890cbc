// ============================================================================
// metrics.hpp -- simple metrics for the sighting estimator queries
// ============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>

namespace sighting {

// ============================================================================
// `EstimatorMetricsSnapshot` struct
// Snapshot of metrics at a point in time, with derived rates.
// ============================================================================
struct EstimatorMetricsSnapshot {
  double        elapsed_sec{0.0};

  // raw counters
  std::uint64_t events_loaded{0};
  std::uint64_t history_loaded{0};

  std::uint64_t peak_queries{0};
  std::uint64_t probability_queries{0};
  std::uint64_t classify_queries{0};
  std::uint64_t wait_queries{0};
  std::uint64_t fits{0};

  std::uint64_t events_scanned{0};
  std::uint64_t boot_trials{0};
  std::uint64_t boot_successes{0};
  std::uint64_t boot_hits{0};

  std::uint64_t empty_inputs{0};
  std::uint64_t insufficient_data{0};
  std::uint64_t invalid_arguments{0};

  // derived
  double boot_trials_per_sec{0.0};
  double boot_hit_ratio{0.0};   // hits / trials
};

// ============================================================================
// `EstimatorMetrics` class
// Lightweight metrics collector for the estimator facade.
// Thread-safe: all increments are atomic, so concurrent queries may share
// one instance.
// ============================================================================
class EstimatorMetrics {
public:
  EstimatorMetrics();

  // Mark events (all atomic, safe from multiple threads)
  void mark_events_loaded(std::uint64_t n);
  void mark_history_loaded(std::uint64_t n);

  void mark_peak_query(std::uint64_t n = 1);
  void mark_probability_query(std::uint64_t n = 1);
  void mark_classify_query(std::uint64_t n = 1);
  void mark_wait_query(std::uint64_t n = 1);
  void mark_fit(std::uint64_t n = 1);

  void mark_events_scanned(std::uint64_t n);
  void mark_boot(std::uint64_t trials, std::uint64_t successes, std::uint64_t hits);

  void mark_empty_input(std::uint64_t n = 1);
  void mark_insufficient_data(std::uint64_t n = 1);
  void mark_invalid_argument(std::uint64_t n = 1);

  // Reset all counters and timers (careful if other threads are reading)
  void reset();

  // Take a snapshot and compute derived rates.
  EstimatorMetricsSnapshot snapshot() const;

  // Pretty-print snapshot to a FILE* (stdout by default).
  void print(std::FILE* out = stdout) const;

private:
  using clock = std::chrono::steady_clock;

  clock::time_point start_;

  std::atomic<std::uint64_t> events_loaded_;
  std::atomic<std::uint64_t> history_loaded_;

  std::atomic<std::uint64_t> peak_queries_;
  std::atomic<std::uint64_t> probability_queries_;
  std::atomic<std::uint64_t> classify_queries_;
  std::atomic<std::uint64_t> wait_queries_;
  std::atomic<std::uint64_t> fits_;

  std::atomic<std::uint64_t> events_scanned_;
  std::atomic<std::uint64_t> boot_trials_;
  std::atomic<std::uint64_t> boot_successes_;
  std::atomic<std::uint64_t> boot_hits_;

  std::atomic<std::uint64_t> empty_inputs_;
  std::atomic<std::uint64_t> insufficient_data_;
  std::atomic<std::uint64_t> invalid_arguments_;
};

} // namespace sighting
