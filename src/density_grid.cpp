// ============================================================================
// density_grid.cpp -- implementation of the DensityGrid estimator
// ============================================================================
#include "density_grid.hpp"
#include "errors.hpp"

#include <cmath>

namespace sighting {

DensityGrid::DensityGrid(double scale) : scale_{scale} {
  if (!std::isfinite(scale_) || scale_ <= 0.0) {
    throw InvalidConfigurationError("GRID: scale must be a positive number");
  }
}

GridKey DensityGrid::bin(const GeoPoint& p) const noexcept {
  return GridKey{static_cast<std::int64_t>(std::llround(p.latitude * scale_)),
                 static_cast<std::int64_t>(std::llround(p.longitude * scale_))};
}

GeoPoint DensityGrid::center(const GridKey& k) const noexcept {
  return GeoPoint{static_cast<double>(k.lat) / scale_,
                  static_cast<double>(k.lon) / scale_};
}

std::unordered_map<GridKey, std::uint64_t, GridKeyHash>
DensityGrid::histogram(const std::vector<SightingEvent>& events) const {
  std::unordered_map<GridKey, std::uint64_t, GridKeyHash> grid;
  grid.reserve(events.size());
  for (const auto& e : events) {
    ++grid[bin(e.position)];
  }
  return grid;
}

PeakLocation DensityGrid::estimate_peak_location(
    const std::vector<SightingEvent>& events) const {
  if (events.empty()) {
    throw EmptyInputError("GRID: no sightings to bin");
  }

  std::unordered_map<GridKey, std::uint64_t, GridKeyHash> grid;
  grid.reserve(events.size());

  GridKey       best{};
  std::uint64_t best_count = 0;
  for (const auto& e : events) {
    const GridKey k = bin(e.position);
    const std::uint64_t c = ++grid[k];
    if (c > best_count) { best_count = c; best = k; }
  }

  return PeakLocation{center(best), best_count, best};
}

} // namespace sighting
