// ============================================================================
// exponential.hpp -- Exponential distribution utilities
//
// Closed-form CDF and survival function for an exponential random variable
// parameterized by its mean (scale = 1 / rate). Used by the inter-arrival
// model to answer "how likely is a wait of at least t hours".
// ============================================================================
#pragma once
#include <cmath>

namespace sighting {

/// Compute the exponential CDF: P(X <= t | mean). Zero for t <= 0.
template<typename FloatType = double>
inline FloatType exponential_cdf(FloatType t, FloatType mean) {
  if (t <= FloatType(0.0)) return FloatType(0.0);
  return -std::expm1(-t / mean);
}

/// Survival function P(X > t | mean). One for t <= 0.
template<typename FloatType = double>
inline FloatType exponential_sf(FloatType t, FloatType mean) {
  if (t <= FloatType(0.0)) return FloatType(1.0);
  return std::exp(-t / mean);
}

} // namespace sighting
