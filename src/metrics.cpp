// ============================================================================
// metrics.cpp -- implementation of EstimatorMetrics
//
// EstimatorMetrics tracks the following counters:
//
// events_loaded_       : Sightings available to the location/pod queries.
// history_loaded_      : Events available to the inter-arrival model.
// peak_queries_        : Calls to estimate_peak_location.
// probability_queries_ : Calls to estimate_probability.
// classify_queries_    : Calls to classify.
// wait_queries_        : Survival-probability queries.
// fits_                : Inter-arrival model fits.
// events_scanned_      : Events passed through a period filter.
// boot_trials_         : Monte Carlo trials run by the area bootstrap.
// boot_successes_      : Trials whose Bernoulli(p) draw succeeded.
// boot_hits_           : Successes that landed inside the visibility box.
// empty_inputs_        : EmptyInputError surfaced to the caller.
// insufficient_data_   : InsufficientDataError surfaced to the caller.
// invalid_arguments_   : InvalidArgumentError surfaced to the caller.
// ============================================================================
#include "metrics.hpp"

namespace sighting {

EstimatorMetrics::EstimatorMetrics()
  : start_(clock::now()),
    events_loaded_(0),
    history_loaded_(0),
    peak_queries_(0),
    probability_queries_(0),
    classify_queries_(0),
    wait_queries_(0),
    fits_(0),
    events_scanned_(0),
    boot_trials_(0),
    boot_successes_(0),
    boot_hits_(0),
    empty_inputs_(0),
    insufficient_data_(0),
    invalid_arguments_(0)
{}

void EstimatorMetrics::mark_events_loaded(std::uint64_t n) {
  events_loaded_.fetch_add(n, std::memory_order_relaxed);
}
void EstimatorMetrics::mark_history_loaded(std::uint64_t n) {
  history_loaded_.fetch_add(n, std::memory_order_relaxed);
}

void EstimatorMetrics::mark_peak_query(std::uint64_t n) {
  peak_queries_.fetch_add(n, std::memory_order_relaxed);
}
void EstimatorMetrics::mark_probability_query(std::uint64_t n) {
  probability_queries_.fetch_add(n, std::memory_order_relaxed);
}
void EstimatorMetrics::mark_classify_query(std::uint64_t n) {
  classify_queries_.fetch_add(n, std::memory_order_relaxed);
}
void EstimatorMetrics::mark_wait_query(std::uint64_t n) {
  wait_queries_.fetch_add(n, std::memory_order_relaxed);
}
void EstimatorMetrics::mark_fit(std::uint64_t n) {
  fits_.fetch_add(n, std::memory_order_relaxed);
}

void EstimatorMetrics::mark_events_scanned(std::uint64_t n) {
  events_scanned_.fetch_add(n, std::memory_order_relaxed);
}
void EstimatorMetrics::mark_boot(std::uint64_t trials, std::uint64_t successes,
                                 std::uint64_t hits) {
  boot_trials_.fetch_add(trials, std::memory_order_relaxed);
  boot_successes_.fetch_add(successes, std::memory_order_relaxed);
  boot_hits_.fetch_add(hits, std::memory_order_relaxed);
}

void EstimatorMetrics::mark_empty_input(std::uint64_t n) {
  empty_inputs_.fetch_add(n, std::memory_order_relaxed);
}
void EstimatorMetrics::mark_insufficient_data(std::uint64_t n) {
  insufficient_data_.fetch_add(n, std::memory_order_relaxed);
}
void EstimatorMetrics::mark_invalid_argument(std::uint64_t n) {
  invalid_arguments_.fetch_add(n, std::memory_order_relaxed);
}

void EstimatorMetrics::reset() {
  start_ = clock::now();
  events_loaded_.store(0, std::memory_order_relaxed);
  history_loaded_.store(0, std::memory_order_relaxed);

  peak_queries_.store(0, std::memory_order_relaxed);
  probability_queries_.store(0, std::memory_order_relaxed);
  classify_queries_.store(0, std::memory_order_relaxed);
  wait_queries_.store(0, std::memory_order_relaxed);
  fits_.store(0, std::memory_order_relaxed);

  events_scanned_.store(0, std::memory_order_relaxed);
  boot_trials_.store(0, std::memory_order_relaxed);
  boot_successes_.store(0, std::memory_order_relaxed);
  boot_hits_.store(0, std::memory_order_relaxed);

  empty_inputs_.store(0, std::memory_order_relaxed);
  insufficient_data_.store(0, std::memory_order_relaxed);
  invalid_arguments_.store(0, std::memory_order_relaxed);
}

EstimatorMetricsSnapshot EstimatorMetrics::snapshot() const {
  EstimatorMetricsSnapshot s{};

  s.elapsed_sec = std::chrono::duration<double>(clock::now() - start_).count();
  if (s.elapsed_sec <= 0.0) s.elapsed_sec = 1e-9; // avoid div-by-zero

  // Load counters
  s.events_loaded       = events_loaded_.load(std::memory_order_relaxed);
  s.history_loaded      = history_loaded_.load(std::memory_order_relaxed);

  s.peak_queries        = peak_queries_.load(std::memory_order_relaxed);
  s.probability_queries = probability_queries_.load(std::memory_order_relaxed);
  s.classify_queries    = classify_queries_.load(std::memory_order_relaxed);
  s.wait_queries        = wait_queries_.load(std::memory_order_relaxed);
  s.fits                = fits_.load(std::memory_order_relaxed);

  s.events_scanned      = events_scanned_.load(std::memory_order_relaxed);
  s.boot_trials         = boot_trials_.load(std::memory_order_relaxed);
  s.boot_successes      = boot_successes_.load(std::memory_order_relaxed);
  s.boot_hits           = boot_hits_.load(std::memory_order_relaxed);

  s.empty_inputs        = empty_inputs_.load(std::memory_order_relaxed);
  s.insufficient_data   = insufficient_data_.load(std::memory_order_relaxed);
  s.invalid_arguments   = invalid_arguments_.load(std::memory_order_relaxed);

  // Derived
  s.boot_trials_per_sec = s.boot_trials / s.elapsed_sec;
  s.boot_hit_ratio = s.boot_trials ? static_cast<double>(s.boot_hits) / s.boot_trials : 0.0;

  return s;
}

void EstimatorMetrics::print(std::FILE* out) const {
  EstimatorMetricsSnapshot s = snapshot();

  std::fprintf(out,
    "\n=== Estimator Stats ===\n"
    "STORE:  sightings=%llu  history=%llu\n"
    "QUERY:  peak=%llu  probability=%llu  classify=%llu  wait=%llu  fits=%llu\n"
    "SCAN:   events=%llu\n"
    "BOOT:   trials=%llu  successes=%llu  hits=%llu  hit_ratio=%.3e\n"
    "ERRORS: empty_input=%llu  insufficient_data=%llu  invalid_argument=%llu\n"
    "\n=== Session ===\n"
    "Elapsed: %.3f s\n"
    "BOOT:    %.1f trials/s\n",
    (unsigned long long)s.events_loaded,
    (unsigned long long)s.history_loaded,
    (unsigned long long)s.peak_queries,
    (unsigned long long)s.probability_queries,
    (unsigned long long)s.classify_queries,
    (unsigned long long)s.wait_queries,
    (unsigned long long)s.fits,
    (unsigned long long)s.events_scanned,
    (unsigned long long)s.boot_trials,
    (unsigned long long)s.boot_successes,
    (unsigned long long)s.boot_hits,
    s.boot_hit_ratio,
    (unsigned long long)s.empty_inputs,
    (unsigned long long)s.insufficient_data,
    (unsigned long long)s.invalid_arguments,
    s.elapsed_sec,
    s.boot_trials_per_sec
  );
}

} // namespace sighting
