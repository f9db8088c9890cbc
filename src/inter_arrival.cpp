// ============================================================================
// inter_arrival.cpp -- implementation of the InterArrivalModel
// ============================================================================
#include "inter_arrival.hpp"
#include "errors.hpp"
#include "exponential.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>

namespace sighting {

namespace {

void check_wait(double t_hours) {
  if (!std::isfinite(t_hours) || t_hours < 0.0) {
    throw InvalidArgumentError("WAIT: waiting time must be a non-negative number of hours");
  }
}

} // namespace

InterArrivalModel InterArrivalModel::fit(const std::vector<SightingEvent>& events) {
  std::vector<double> hours;
  hours.reserve(events.size());
  for (const auto& e : events) {
    const auto h = std::chrono::duration<double, std::ratio<3600>>(e.timestamp.time_since_epoch());
    hours.push_back(h.count());
  }
  return fit_hours(std::move(hours));
}

InterArrivalModel InterArrivalModel::fit_hours(std::vector<double> hours) {
  std::sort(hours.begin(), hours.end());
  hours.erase(std::unique(hours.begin(), hours.end()), hours.end());

  if (hours.size() < 2) {
    throw InsufficientDataError("WAIT: need at least two distinct timestamps, have "
                                + std::to_string(hours.size()));
  }

  std::vector<double> diffs(hours.size());
  std::adjacent_difference(hours.begin(), hours.end(), diffs.begin());
  const double total = std::accumulate(diffs.begin() + 1, diffs.end(), 0.0);
  const double mean  = total / static_cast<double>(diffs.size() - 1);

  return InterArrivalModel{mean, hours.size()};
}

double InterArrivalModel::cdf(double t_hours) const {
  check_wait(t_hours);
  return exponential_cdf(t_hours, mean_hours_);
}

double InterArrivalModel::survival(double t_hours) const {
  check_wait(t_hours);
  return exponential_sf(t_hours, mean_hours_);
}

double survival_probability(const InterArrivalModel& model, double t_hours) {
  return model.survival(t_hours);
}

} // namespace sighting
