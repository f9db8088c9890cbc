// ============================================================================
// event_store.hpp -- In-memory store of sighting events and period filters
//
// Loads a delimited sightings file (one row per event: date, category,
// latitude, longitude; header row skipped) into immutable SightingEvent
// records, and hands out filtered copies to the estimators.
//
// Columns past the fourth are ignored. Any malformed row fails the whole load:
// silently skipping rows would bias the density and classification estimates.
// History files feed only the inter-arrival model and are read with
// RecordLayout::DatesOnly, where the date is the only required column.
// ============================================================================
#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

#include "sighting.hpp"

namespace sighting {

/// Predicate selecting the events of a period.
using PeriodFilter = std::function<bool(const SightingEvent&)>;

/// Events recorded in calendar month `month` (1..12) of any year.
/// @throws InvalidArgumentError for a month outside 1..12.
PeriodFilter by_month(unsigned month);

/// Events with from <= day <= to (inclusive, day resolution).
/// @throws InvalidArgumentError if from is after to.
PeriodFilter by_date_range(std::chrono::sys_days from, std::chrono::sys_days to);

/// Every event.
PeriodFilter all_events();

/// Parse "MM/DD/YY" (two-digit years pivot at 69) or "MM/DD/YYYY".
/// @throws InvalidArgumentError if the date cannot be parsed or is invalid.
std::chrono::sys_days parse_date(const std::string& text);

/// Split one CSV row, honoring double-quoted fields ("" escapes a quote).
/// @throws InvalidArgumentError on an unterminated quote.
std::vector<std::string> split_csv_row(const std::string& line);

/// Columns a row must carry.
enum class RecordLayout {
  Sightings,   ///< date, category, latitude, longitude
  DatesOnly,   ///< date; category kept if present, coordinates ignored
};

// ============================================================================
// `EventStore` class
// ============================================================================
class EventStore {
public:
  EventStore() = default;
  explicit EventStore(std::vector<SightingEvent> events);

  /// Parse CSV text; the first non-empty line is the header.
  /// @throws MalformedRecordError on the first bad row.
  [[nodiscard]] static EventStore from_stream(std::istream& in,
                                              RecordLayout layout = RecordLayout::Sightings);

  /// Open and parse `path`.
  /// @throws InvalidArgumentError if the file cannot be opened.
  /// @throws MalformedRecordError on the first bad row.
  [[nodiscard]] static EventStore load_csv(const std::string& path,
                                           RecordLayout layout = RecordLayout::Sightings);

  [[nodiscard]] const std::vector<SightingEvent>& events() const noexcept { return events_; }
  [[nodiscard]] std::size_t size() const noexcept { return events_.size(); }
  [[nodiscard]] bool empty() const noexcept { return events_.empty(); }

  /// Matching events, in their original order.
  [[nodiscard]] std::vector<SightingEvent> select(const PeriodFilter& filter) const;

private:
  std::vector<SightingEvent> events_;
};

} // namespace sighting
