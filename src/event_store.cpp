// ============================================================================
// event_store.cpp -- CSV loading and period filtering for sighting events
// ============================================================================
#include "event_store.hpp"
#include "errors.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <system_error>
#include <utility>

namespace sighting {

namespace {

constexpr std::size_t FIELD_DATE     = 0;
constexpr std::size_t FIELD_CATEGORY = 1;
constexpr std::size_t FIELD_LAT      = 2;
constexpr std::size_t FIELD_LONG     = 3;
constexpr std::size_t FIELD_COUNT    = 4;

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

bool parse_uint(const std::string& s, unsigned& out) {
  if (s.empty()) return false;
  const char* end = s.data() + s.size();
  auto [ptr, ec] = std::from_chars(s.data(), end, out);
  return ec == std::errc{} && ptr == end;
}

bool parse_double(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  out = std::strtod(s.c_str(), &end);
  return errno == 0 && end == s.c_str() + s.size() && std::isfinite(out);
}

} // namespace

// ============================================================================
// Period filters
// ============================================================================
PeriodFilter by_month(unsigned month) {
  if (month < 1 || month > 12) {
    throw InvalidArgumentError("month must be in 1..12, got " + std::to_string(month));
  }
  return [month](const SightingEvent& e) {
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(e.timestamp)};
    return static_cast<unsigned>(ymd.month()) == month;
  };
}

PeriodFilter by_date_range(std::chrono::sys_days from, std::chrono::sys_days to) {
  if (from > to) {
    throw InvalidArgumentError("date range start is after its end");
  }
  return [from, to](const SightingEvent& e) {
    const auto day = std::chrono::floor<std::chrono::days>(e.timestamp);
    return from <= day && day <= to;
  };
}

PeriodFilter all_events() {
  return [](const SightingEvent&) { return true; };
}

// ============================================================================
// Field parsing
// ============================================================================
std::chrono::sys_days parse_date(const std::string& text) {
  const std::string s = trim(text);
  const auto slash1 = s.find('/');
  const auto slash2 = slash1 == std::string::npos ? slash1 : s.find('/', slash1 + 1);
  if (slash2 == std::string::npos) {
    throw InvalidArgumentError("date '" + s + "' is not MM/DD/YY");
  }

  unsigned m = 0, d = 0, y = 0;
  const std::string year_txt = s.substr(slash2 + 1);
  if (!parse_uint(s.substr(0, slash1), m) ||
      !parse_uint(s.substr(slash1 + 1, slash2 - slash1 - 1), d) ||
      !parse_uint(year_txt, y) ||
      (year_txt.size() != 2 && year_txt.size() != 4)) {
    throw InvalidArgumentError("date '" + s + "' is not MM/DD/YY");
  }
  if (year_txt.size() == 2) y += (y < 69) ? 2000 : 1900;
  // chrono::month and chrono::day only hold a byte, check before narrowing.
  if (m < 1 || m > 12 || d < 1 || d > 31) {
    throw InvalidArgumentError("date '" + s + "' is not a calendar date");
  }

  const std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(y)},
                                        std::chrono::month{m},
                                        std::chrono::day{d}};
  if (!ymd.ok()) {
    throw InvalidArgumentError("date '" + s + "' is not a calendar date");
  }
  return std::chrono::sys_days{ymd};
}

std::vector<std::string> split_csv_row(const std::string& line) {
  std::vector<std::string> fields;
  std::string cur;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') { cur += '"'; ++i; }
        else quoted = false;
      } else {
        cur += c;
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(std::move(cur));
      cur.clear();
    } else {
      cur += c;
    }
  }
  if (quoted) {
    throw InvalidArgumentError("unterminated quoted field");
  }
  fields.push_back(std::move(cur));
  return fields;
}

// ============================================================================
// EventStore
// ============================================================================
EventStore::EventStore(std::vector<SightingEvent> events) : events_{std::move(events)} {}

EventStore EventStore::from_stream(std::istream& in, RecordLayout layout) {
  std::vector<SightingEvent> events;
  std::string line;
  std::size_t line_no = 0;
  bool header_seen = false;
  const std::size_t required = layout == RecordLayout::DatesOnly ? FIELD_DATE + 1 : FIELD_COUNT;

  while (std::getline(in, line)) {
    ++line_no;
    if (trim(line).empty()) continue;
    if (!header_seen) { header_seen = true; continue; }

    try {
      const auto fields = split_csv_row(line);
      if (fields.size() < required) {
        throw InvalidArgumentError("expected at least " + std::to_string(required)
                                   + " fields, found " + std::to_string(fields.size()));
      }

      SightingEvent e;
      e.timestamp = parse_date(fields[FIELD_DATE]);
      if (fields.size() > FIELD_CATEGORY) e.category = trim(fields[FIELD_CATEGORY]);
      if (layout == RecordLayout::Sightings) {
        if (!parse_double(trim(fields[FIELD_LAT]), e.position.latitude)) {
          throw InvalidArgumentError("latitude '" + fields[FIELD_LAT] + "' is not a number");
        }
        if (!parse_double(trim(fields[FIELD_LONG]), e.position.longitude)) {
          throw InvalidArgumentError("longitude '" + fields[FIELD_LONG] + "' is not a number");
        }
        validate_point(e.position);
      }
      events.push_back(std::move(e));
    } catch (const InvalidArgumentError& err) {
      throw MalformedRecordError(line_no, err.what());
    }
  }

  if (in.bad()) {
    throw InvalidArgumentError("STORE: read error after line " + std::to_string(line_no));
  }
  return EventStore{std::move(events)};
}

EventStore EventStore::load_csv(const std::string& path, RecordLayout layout) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw InvalidArgumentError("STORE: failed to open '" + path + "' for input");
  }
  return from_stream(file, layout);
}

std::vector<SightingEvent> EventStore::select(const PeriodFilter& filter) const {
  std::vector<SightingEvent> out;
  for (const auto& e : events_) {
    if (filter(e)) out.push_back(e);
  }
  return out;
}

} // namespace sighting
