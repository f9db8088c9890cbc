// ============================================================================
// estimator.hpp -- Query facade over the four sighting estimators
//
// This header defines the SightingEstimator class, which owns the loaded
// sightings and history and answers the queries a front end needs:
//
// - estimate_peak_location: densest grid cell for a period.
// - estimate_probability:   area-bootstrap encounter probability at a
//                           location for a period.
// - classify:               most probable pod at a location for a period.
// - fit / fit_and_query:    exponential waiting-time model over the full
//                           history and its tail probability.
//
// Each query re-filters and re-derives from the stored events; nothing is
// cached between calls, so concurrent queries are safe. Only the metrics
// counters (atomic) are shared.
// ============================================================================
#pragma once
#include <memory>

#include "area_bootstrap.hpp"
#include "config.hpp"
#include "density_grid.hpp"
#include "event_store.hpp"
#include "inter_arrival.hpp"
#include "metrics.hpp"
#include "pod_classifier.hpp"
#include "sighting.hpp"

namespace sighting {

// ============================================================================
// SightingEstimator class
// ============================================================================
class SightingEstimator {
public:
  /// @param cfg       Validated on construction.
  /// @param sightings Events used by the location, probability and pod queries.
  /// @param history   Events used by the inter-arrival model.
  /// @throws InvalidConfigurationError if `cfg` is unusable.
  SightingEstimator(Config cfg, EventStore sightings, EventStore history);

  /// Same store for both roles.
  SightingEstimator(Config cfg, EventStore sightings);

  ~SightingEstimator();

  SightingEstimator(const SightingEstimator&) = delete;
  SightingEstimator& operator=(const SightingEstimator&) = delete;

  /// @throws EmptyInputError if no sighting matches `period`.
  [[nodiscard]] PeakLocation estimate_peak_location(const PeriodFilter& period) const;

  /// Full bootstrap breakdown for `location` over the period's sightings.
  [[nodiscard]] BootstrapResult run_bootstrap(const GeoPoint& location,
                                              const PeriodFilter& period) const;

  /// Smoothed encounter probability in (0, 1].
  [[nodiscard]] double estimate_probability(const GeoPoint& location,
                                            const PeriodFilter& period) const;

  [[nodiscard]] PodDistribution classify(const GeoPoint& location,
                                         const PeriodFilter& period) const;

  /// @throws InsufficientDataError if history has < 2 distinct timestamps.
  [[nodiscard]] InterArrivalModel fit() const;

  /// P(wait > wait_hours) under a freshly fitted model.
  [[nodiscard]] double fit_and_query(double wait_hours) const;

  [[nodiscard]] const Config& config() const noexcept;
  [[nodiscard]] const EventStore& sightings() const noexcept;
  [[nodiscard]] const EventStore& history() const noexcept;
  [[nodiscard]] const EstimatorMetrics& metrics() const noexcept;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace sighting
