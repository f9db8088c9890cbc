// ============================================================================
// sighting.cpp -- GeoPoint validation and BoundingBox construction
// ============================================================================
#include "sighting.hpp"
#include "errors.hpp"

#include <cmath>
#include <cstdio>

namespace sighting {

void validate_point(const GeoPoint& p) {
  if (!std::isfinite(p.latitude) || p.latitude < -90.0 || p.latitude > 90.0) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "latitude %g outside [-90, 90]", p.latitude);
    throw InvalidArgumentError(buf);
  }
  if (!std::isfinite(p.longitude) || p.longitude < -180.0 || p.longitude > 180.0) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "longitude %g outside [-180, 180]", p.longitude);
    throw InvalidArgumentError(buf);
  }
}

BoundingBox BoundingBox::centered(const GeoPoint& center, double half_width) {
  if (!std::isfinite(half_width) || half_width < 0.0) {
    throw InvalidArgumentError("bounding box half-width must be >= 0");
  }
  return BoundingBox{center.latitude - half_width, center.latitude + half_width,
                     center.longitude - half_width, center.longitude + half_width};
}

} // namespace sighting
