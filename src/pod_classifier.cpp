// ============================================================================
// pod_classifier.cpp -- implementation of the PodClassifier
// ============================================================================
#include "pod_classifier.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace sighting {

const CategoryProbability* PodDistribution::find(const std::string& category) const noexcept {
  for (const auto& e : entries) {
    if (e.category == category) return &e;
  }
  return nullptr;
}

double PodDistribution::probability(const std::string& category) const noexcept {
  const auto* e = find(category);
  return e ? e->probability : 0.0;
}

const CategoryProbability& PodDistribution::mode_entry() const {
  const auto* e = find(mode);
  if (!e) throw InvalidConfigurationError("POD: distribution has no mode");
  return *e;
}

PodClassifier::PodClassifier(std::vector<std::string> categories, double daily_range)
: categories_{std::move(categories)}, daily_range_{daily_range} {
  if (categories_.empty()) {
    throw InvalidConfigurationError("POD: category set is empty");
  }
  for (std::size_t i = 0; i < categories_.size(); ++i) {
    if (categories_[i].empty()) {
      throw InvalidConfigurationError("POD: blank category label");
    }
    if (std::find(categories_.begin(), categories_.begin() + i, categories_[i])
        != categories_.begin() + i) {
      throw InvalidConfigurationError("POD: duplicate category '" + categories_[i] + "'");
    }
  }
  if (!std::isfinite(daily_range_) || daily_range_ < 0.0) {
    throw InvalidArgumentError("POD: daily_range must be >= 0");
  }
}

PodDistribution PodClassifier::classify(const std::vector<SightingEvent>& events,
                                        const GeoPoint& candidate) const {
  validate_point(candidate);
  const BoundingBox bounds = BoundingBox::centered(candidate, daily_range_);

  PodDistribution d;
  d.entries.reserve(categories_.size());
  for (const auto& c : categories_) {
    d.entries.push_back(CategoryProbability{c, 1, 0.0, 0.0});
  }
  d.grand_total = categories_.size();

  for (const auto& e : events) {
    if (!bounds.contains(e.position)) continue;
    ++d.nearby_events;
    ++d.grand_total;
    for (auto& entry : d.entries) {
      if (e.category.find(entry.category) != std::string::npos) ++entry.count;
    }
  }

  std::uint64_t count_sum = 0;
  for (const auto& entry : d.entries) count_sum += entry.count;

  const CategoryProbability* best = nullptr;
  for (auto& entry : d.entries) {
    entry.probability = static_cast<double>(entry.count) / static_cast<double>(count_sum);
    entry.presence    = static_cast<double>(entry.count) / static_cast<double>(d.grand_total);
    if (!best || entry.count > best->count) best = &entry;
  }
  d.mode = best->category;
  return d;
}

PodDistribution classify(const std::vector<SightingEvent>& events,
                         const GeoPoint& candidate,
                         const std::vector<std::string>& categories,
                         double daily_range) {
  return PodClassifier(categories, daily_range).classify(events, candidate);
}

} // namespace sighting
