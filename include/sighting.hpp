// ============================================================================
// sighting.hpp -- Core value types shared by the estimators
//
// Types defined:
// - GeoPoint:      latitude/longitude pair in decimal degrees.
// - SightingEvent: one recorded observation (timestamp, category, position).
// - BoundingBox:   axis-aligned lat/long rectangle with strict containment.
//
// Coordinates are treated on a flat-earth approximation; one degree is one
// unit of "area" on both axes.
// ============================================================================
#pragma once
#include <chrono>
#include <string>

namespace sighting {

// ============================================================================
// `GeoPoint` struct
// ============================================================================
struct GeoPoint {
  double latitude{0.0};
  double longitude{0.0};
};

/// Throws InvalidArgumentError unless the point is finite and within
/// [-90, 90] x [-180, 180].
void validate_point(const GeoPoint& p);

// ============================================================================
// `SightingEvent` struct
// Immutable once loaded; all estimators read it only.
// ============================================================================
struct SightingEvent {
  std::chrono::sys_seconds timestamp{};
  std::string              category;   // possibly compound, e.g. "J, K"
  GeoPoint                 position;
};

// ============================================================================
// `BoundingBox` struct
// ============================================================================
struct BoundingBox {
  double lat_min{0.0};
  double lat_max{0.0};
  double long_min{0.0};
  double long_max{0.0};

  /// Square of half-width `half_width` centered on `center`. A zero
  /// half-width gives a degenerate box with zero area.
  /// @throws InvalidArgumentError if half_width is negative or not finite.
  static BoundingBox centered(const GeoPoint& center, double half_width);

  [[nodiscard]] double area() const noexcept {
    return (lat_max - lat_min) * (long_max - long_min);
  }

  /// Strict containment on both axes.
  [[nodiscard]] bool contains(double lat, double lon) const noexcept {
    return lat_min < lat && lat < lat_max && long_min < lon && lon < long_max;
  }
  [[nodiscard]] bool contains(const GeoPoint& p) const noexcept {
    return contains(p.latitude, p.longitude);
  }
};

} // namespace sighting
