// ============================================================================
// pod_classifier.hpp -- Laplace-smoothed categorical pod classifier
//
// Counts nearby sightings by category label. Every known category starts at
// one (add-one smoothing) and the grand total starts at the category count.
// A label is matched by substring, so a compound label such as "J, K"
// increments every category it contains, while the grand total increments
// once per event whatever it matched.
//
// Two measures are reported per category:
// - probability: count / sum(counts). Sums to 1, strictly positive.
// - presence:    count / grand_total. The multi-label accounting; can sum
//                to more than 1 when sightings contain several pods.
// Both share a denominator across categories, so the mode is the same.
// ============================================================================
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "sighting.hpp"

namespace sighting {

struct CategoryProbability {
  std::string   category;
  std::uint64_t count{0};        // smoothed (starts at 1)
  double        probability{0.0};
  double        presence{0.0};
};

// ============================================================================
// `PodDistribution` struct
// Entries are in category enumeration order.
// ============================================================================
struct PodDistribution {
  std::vector<CategoryProbability> entries;
  std::string                      mode;
  std::uint64_t                    nearby_events{0};
  std::uint64_t                    grand_total{0};

  /// Entry for `category`, or nullptr if it is not a known category.
  [[nodiscard]] const CategoryProbability* find(const std::string& category) const noexcept;

  /// Normalized probability of `category` (0.0 if unknown).
  [[nodiscard]] double probability(const std::string& category) const noexcept;

  /// Entry for the mode category.
  [[nodiscard]] const CategoryProbability& mode_entry() const;
};

// ============================================================================
// `PodClassifier` class
// ============================================================================
class PodClassifier {
public:
  /// @param categories Known labels in enumeration order (ties resolve to the
  ///                   earliest). Must be non-empty, non-blank and unique.
  /// @param daily_range Half-width of the neighborhood box in degrees.
  /// @throws InvalidConfigurationError on an unusable category list.
  /// @throws InvalidArgumentError on a negative daily_range.
  explicit PodClassifier(std::vector<std::string> categories, double daily_range = 1.0);

  [[nodiscard]] const std::vector<std::string>& categories() const noexcept {
    return categories_;
  }
  [[nodiscard]] double daily_range() const noexcept { return daily_range_; }

  /// Classify the sightings within daily_range of `candidate`.
  [[nodiscard]] PodDistribution classify(const std::vector<SightingEvent>& events,
                                         const GeoPoint& candidate) const;

private:
  std::vector<std::string> categories_;
  double                   daily_range_;
};

/// Free-function form of PodClassifier::classify.
[[nodiscard]] PodDistribution classify(const std::vector<SightingEvent>& events,
                                       const GeoPoint& candidate,
                                       const std::vector<std::string>& categories,
                                       double daily_range = 1.0);

} // namespace sighting
