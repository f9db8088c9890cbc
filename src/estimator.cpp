// ============================================================================
// estimator.cpp -- implementation of the SightingEstimator facade
// ============================================================================
#include "estimator.hpp"
#include "errors.hpp"

#include <cstdio>
#include <utility>

namespace sighting {

namespace {

Config validated(Config cfg) {
  cfg.validate();
  return cfg;
}

} // namespace

// ============================================================================
// `Impl` class
// Holds the stores, the configured estimators, and the metrics.
// ============================================================================
struct SightingEstimator::Impl {
  Impl(Config cfg_, EventStore sightings_, EventStore history_)
   : cfg(validated(std::move(cfg_))),
     sightings(std::move(sightings_)), history(std::move(history_)),
     grid(cfg.SCALE), pods(cfg.CATEGORIES, cfg.POD_DAILY_RANGE) {
    metrics.mark_events_loaded(sightings.size());
    metrics.mark_history_loaded(history.size());
  }

  Config        cfg;
  EventStore    sightings;
  EventStore    history;
  DensityGrid   grid;
  PodClassifier pods;

  mutable EstimatorMetrics metrics;

  /// Apply the period filter and count the scan.
  std::vector<SightingEvent> select(const PeriodFilter& period) const {
    auto events = sightings.select(period);
    metrics.mark_events_scanned(sightings.size());
    return events;
  }
};

SightingEstimator::SightingEstimator(Config cfg, EventStore sightings, EventStore history)
  : impl_(std::make_unique<Impl>(std::move(cfg), std::move(sightings), std::move(history))) {}

SightingEstimator::SightingEstimator(Config cfg, EventStore sightings)
  : SightingEstimator(std::move(cfg), sightings, sightings) {}

SightingEstimator::~SightingEstimator() = default;

PeakLocation SightingEstimator::estimate_peak_location(const PeriodFilter& period) const {
  auto& m = impl_->metrics;
  m.mark_peak_query();

  const auto events = impl_->select(period);
  try {
    PeakLocation peak = impl_->grid.estimate_peak_location(events);
    if (impl_->cfg.VERBOSE) {
      std::printf("GRID: %zu sightings, peak cell (%.2f, %.2f) with %llu\n",
                  events.size(), peak.location.latitude, peak.location.longitude,
                  (unsigned long long)peak.count);
    }
    return peak;
  } catch (const EmptyInputError&) {
    m.mark_empty_input();
    throw;
  }
}

BootstrapResult SightingEstimator::run_bootstrap(const GeoPoint& location,
                                                 const PeriodFilter& period) const {
  auto& m = impl_->metrics;
  m.mark_probability_query();

  const auto events = impl_->select(period);
  try {
    BootstrapResult r = run_area_bootstrap(location, events, impl_->cfg.bootstrap_params());
    m.mark_boot(r.trials, r.successes, r.hits);
    if (impl_->cfg.VERBOSE) {
      std::printf("BOOT: %llu events in bounds, p=%.6f, hits=%llu/%llu\n",
                  (unsigned long long)r.events_in_bounds, r.mixture_weight,
                  (unsigned long long)r.hits, (unsigned long long)r.trials);
    }
    return r;
  } catch (const InvalidArgumentError&) {
    m.mark_invalid_argument();
    throw;
  }
}

double SightingEstimator::estimate_probability(const GeoPoint& location,
                                               const PeriodFilter& period) const {
  return run_bootstrap(location, period).probability;
}

PodDistribution SightingEstimator::classify(const GeoPoint& location,
                                            const PeriodFilter& period) const {
  auto& m = impl_->metrics;
  m.mark_classify_query();

  const auto events = impl_->select(period);
  try {
    PodDistribution d = impl_->pods.classify(events, location);
    if (impl_->cfg.VERBOSE) {
      std::printf("POD: %llu nearby sightings, mode %s\n",
                  (unsigned long long)d.nearby_events, d.mode.c_str());
    }
    return d;
  } catch (const InvalidArgumentError&) {
    m.mark_invalid_argument();
    throw;
  }
}

InterArrivalModel SightingEstimator::fit() const {
  auto& m = impl_->metrics;
  m.mark_fit();
  try {
    InterArrivalModel model = InterArrivalModel::fit(impl_->history.events());
    if (impl_->cfg.VERBOSE) {
      std::printf("WAIT: %zu distinct days, mean wait %.3f h\n",
                  model.distinct_events(), model.mean_hours());
    }
    return model;
  } catch (const InsufficientDataError&) {
    m.mark_insufficient_data();
    throw;
  }
}

double SightingEstimator::fit_and_query(double wait_hours) const {
  const InterArrivalModel model = fit();
  impl_->metrics.mark_wait_query();
  try {
    return model.survival(wait_hours);
  } catch (const InvalidArgumentError&) {
    impl_->metrics.mark_invalid_argument();
    throw;
  }
}

const Config& SightingEstimator::config() const noexcept { return impl_->cfg; }
const EventStore& SightingEstimator::sightings() const noexcept { return impl_->sightings; }
const EventStore& SightingEstimator::history() const noexcept { return impl_->history; }
const EstimatorMetrics& SightingEstimator::metrics() const noexcept { return impl_->metrics; }

} // namespace sighting
