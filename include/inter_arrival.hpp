// ============================================================================
// inter_arrival.hpp -- Exponential inter-arrival time model
//
// Fits the mean waiting time between sightings from the distinct event
// timestamps (identical instants count once), then answers tail-probability
// queries against Exponential(rate = 1 / mean). Stateless after fitting.
// ============================================================================
#pragma once
#include <cstddef>
#include <vector>

#include "sighting.hpp"

namespace sighting {

// ============================================================================
// `InterArrivalModel` class
// ============================================================================
class InterArrivalModel {
public:
  /// Fit from events; order and duplicates do not matter.
  /// @throws InsufficientDataError if fewer than two distinct timestamps.
  [[nodiscard]] static InterArrivalModel fit(const std::vector<SightingEvent>& events);

  /// Fit from timestamps already expressed in hours.
  /// @throws InsufficientDataError if fewer than two distinct values.
  [[nodiscard]] static InterArrivalModel fit_hours(std::vector<double> hours);

  /// Mean inter-arrival time in hours (expected wait).
  [[nodiscard]] double mean_hours() const noexcept { return mean_hours_; }

  /// Rate of the fitted exponential, events per hour.
  [[nodiscard]] double rate() const noexcept { return 1.0 / mean_hours_; }

  /// Number of distinct instants the model was fitted on.
  [[nodiscard]] std::size_t distinct_events() const noexcept { return distinct_; }

  /// P(wait <= t). @throws InvalidArgumentError for negative or non-finite t.
  [[nodiscard]] double cdf(double t_hours) const;

  /// P(wait > t) = 1 - cdf(t). @throws InvalidArgumentError for negative or
  /// non-finite t.
  [[nodiscard]] double survival(double t_hours) const;

private:
  InterArrivalModel(double mean_hours, std::size_t distinct)
  : mean_hours_{mean_hours}, distinct_{distinct} {}

  double      mean_hours_;
  std::size_t distinct_;
};

/// Free-function form of InterArrivalModel::survival.
[[nodiscard]] double survival_probability(const InterArrivalModel& model, double t_hours);

} // namespace sighting
