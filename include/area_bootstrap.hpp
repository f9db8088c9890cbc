// ============================================================================
// area_bootstrap.hpp -- Area-bootstrap estimator of local encounter probability
//
// Given a candidate location and nearby sightings:
//
// 1. whale_bounds: square of half-width `daily_range` around the candidate,
//    the area the subject could plausibly occupy in a day. Events outside it
//    are dropped.
// 2. Each remaining event is inflated to a square of half-width
//    `point_radius`. sight_bounds is the same-size square around the
//    candidate (what an observer there can see).
// 3. p = sum(event square areas) / area(whale_bounds). Areas are summed, not
//    unioned, so overlapping squares count twice. This is a known modeling
//    simplification and is kept on purpose.
// 4. `trials` Bernoulli(p) draws; each success places a point uniformly in
//    whale_bounds and counts a hit if it also lands inside sight_bounds.
// 5. Result is (hits + 1) / (trials + 1), never exactly zero.
//
// With no events or a zero-area whale_bounds, p = 0 and the result is
// 1 / (trials + 1).
// ============================================================================
#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "sighting.hpp"

namespace sighting {

// ============================================================================
// `BootstrapParams` struct
// ============================================================================
struct BootstrapParams {
  double                       daily_range{1.0};     // degrees, half-width of whale_bounds
  double                       point_radius{0.01};   // degrees, ~1.1 km
  std::uint64_t                trials{100000};
  std::optional<std::uint64_t> seed{};               // unset => std::random_device
};

// ============================================================================
// `BootstrapResult` struct
// Intermediate values kept for diagnostics.
// ============================================================================
struct BootstrapResult {
  double        probability{0.0};   // Laplace-smoothed estimate
  double        mixture_weight{0.0}; // analytic p from step 3 (may exceed 1)
  std::uint64_t events_in_bounds{0};
  std::uint64_t successes{0};        // Bernoulli(p) successes
  std::uint64_t hits{0};             // successes that landed in sight_bounds
  std::uint64_t trials{0};
};

/// Run the full bootstrap and return the diagnostic breakdown.
/// @throws InvalidArgumentError for a bad candidate, negative ranges, or
///         zero trials.
[[nodiscard]] BootstrapResult run_area_bootstrap(
    const GeoPoint& candidate,
    const std::vector<SightingEvent>& nearby_events,
    const BootstrapParams& params = {});

/// Convenience wrapper returning only the smoothed probability.
[[nodiscard]] double estimate_probability(
    const GeoPoint& candidate,
    const std::vector<SightingEvent>& nearby_events,
    const BootstrapParams& params = {});

} // namespace sighting
