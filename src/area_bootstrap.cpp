// ============================================================================
// area_bootstrap.cpp -- implementation of the area-bootstrap estimator
// ============================================================================
#include "area_bootstrap.hpp"
#include "errors.hpp"

#include <cmath>
#include <random>

namespace sighting {

namespace {

std::mt19937_64 make_engine(const std::optional<std::uint64_t>& seed) {
  if (seed) return std::mt19937_64{*seed};
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  return std::mt19937_64{seq};
}

/// Summed (not unioned) area of the inflated event squares inside `bounds`.
double occupied_area(const BoundingBox& bounds,
                     const std::vector<SightingEvent>& events,
                     double point_radius,
                     std::uint64_t& in_bounds) {
  double total = 0.0;
  in_bounds = 0;
  for (const auto& e : events) {
    if (!bounds.contains(e.position)) continue;
    ++in_bounds;
    total += BoundingBox::centered(e.position, point_radius).area();
  }
  return total;
}

} // namespace

BootstrapResult run_area_bootstrap(const GeoPoint& candidate,
                                   const std::vector<SightingEvent>& nearby_events,
                                   const BootstrapParams& params) {
  validate_point(candidate);
  if (params.trials == 0) {
    throw InvalidArgumentError("BOOT: trials must be > 0");
  }
  if (!std::isfinite(params.point_radius) || params.point_radius < 0.0) {
    throw InvalidArgumentError("BOOT: point_radius must be >= 0");
  }

  const BoundingBox whale_bounds = BoundingBox::centered(candidate, params.daily_range);
  const BoundingBox sight_bounds = BoundingBox::centered(candidate, params.point_radius);

  BootstrapResult r;
  r.trials = params.trials;

  const double sample_space = whale_bounds.area();
  if (sample_space > 0.0 && !nearby_events.empty()) {
    const double event_space =
        occupied_area(whale_bounds, nearby_events, params.point_radius, r.events_in_bounds);
    r.mixture_weight = event_space / sample_space;
  }

  if (r.mixture_weight > 0.0) {
    std::mt19937_64 rng = make_engine(params.seed);
    std::uniform_real_distribution<double> chance(0.0, 1.0);
    std::uniform_real_distribution<double> lat(whale_bounds.lat_min, whale_bounds.lat_max);
    std::uniform_real_distribution<double> lon(whale_bounds.long_min, whale_bounds.long_max);

    for (std::uint64_t i = 0; i < params.trials; ++i) {
      if (chance(rng) > r.mixture_weight) continue;
      ++r.successes;
      const double y = lat(rng);
      const double x = lon(rng);
      if (sight_bounds.contains(y, x)) ++r.hits;
    }
  }

  r.probability = static_cast<double>(r.hits + 1) / static_cast<double>(params.trials + 1);
  return r;
}

double estimate_probability(const GeoPoint& candidate,
                            const std::vector<SightingEvent>& nearby_events,
                            const BootstrapParams& params) {
  return run_area_bootstrap(candidate, nearby_events, params).probability;
}

} // namespace sighting
