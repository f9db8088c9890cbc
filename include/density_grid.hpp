// ============================================================================
// density_grid.hpp -- Density grid estimator for peak sighting location
//
// Bins sightings into a sparse grid keyed by (round(lat * scale),
// round(long * scale)) and reports the cell with the highest count. With
// scale = 100 a cell is roughly 1.1 km across.
//
// Ties: counts are accumulated in a single pass over the events in their
// given order and the leader only changes on a strictly greater count, so
// the first cell to reach the maximum count wins.
// ============================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "sighting.hpp"

namespace sighting {

// ============================================================================
// `GridKey` struct
// Discretized (lat, long) bin pair.
// ============================================================================
struct GridKey {
  std::int64_t lat{0};
  std::int64_t lon{0};

  bool operator==(const GridKey&) const = default;
};

struct GridKeyHash {
  std::size_t operator()(const GridKey& k) const noexcept {
    const auto a = static_cast<std::uint64_t>(k.lat);
    const auto b = static_cast<std::uint64_t>(k.lon);
    return static_cast<std::size_t>(a * 0x9E3779B97F4A7C15ull ^ (b + (a << 6) + (a >> 2)));
  }
};

// ============================================================================
// `PeakLocation` struct
// Winning cell, converted back to real coordinates.
// ============================================================================
struct PeakLocation {
  GeoPoint      location;
  std::uint64_t count{0};
  GridKey       cell;
};

// ============================================================================
// `DensityGrid` class
// ============================================================================
class DensityGrid {
public:
  static constexpr double DEFAULT_SCALE = 100.0;

  /// @param scale Bins per degree; must be positive and finite.
  explicit DensityGrid(double scale = DEFAULT_SCALE);

  [[nodiscard]] double scale() const noexcept { return scale_; }

  [[nodiscard]] GridKey bin(const GeoPoint& p) const noexcept;
  [[nodiscard]] GeoPoint center(const GridKey& k) const noexcept;

  /// Count all events into a sparse grid.
  [[nodiscard]] std::unordered_map<GridKey, std::uint64_t, GridKeyHash>
  histogram(const std::vector<SightingEvent>& events) const;

  /// Cell with the maximum count.
  /// @throws EmptyInputError if `events` is empty.
  [[nodiscard]] PeakLocation estimate_peak_location(
      const std::vector<SightingEvent>& events) const;

private:
  double scale_;
};

} // namespace sighting
