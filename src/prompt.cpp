// ============================================================================
// prompt.cpp -- Input parsers for the interactive shell
// ============================================================================
#include "prompt.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>

namespace sighting {

namespace {

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

bool all_digits(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

std::optional<unsigned> parse_month_day(const std::string& text) {
  const std::string s = trim(text);
  if ((s.size() != 2 && s.size() != 4) || !all_digits(s)) return std::nullopt;

  const unsigned month = static_cast<unsigned>(std::stoul(s.substr(0, 2)));
  if (month < 1 || month > 12) return std::nullopt;
  if (s.size() == 4) {
    const unsigned day = static_cast<unsigned>(std::stoul(s.substr(2, 2)));
    // Leap year so that 0229 is accepted.
    const std::chrono::year_month_day ymd{std::chrono::year{2024}, std::chrono::month{month},
                                          std::chrono::day{day}};
    if (!ymd.ok()) return std::nullopt;
  }
  return month;
}

std::optional<bool> parse_yes_no(const std::string& text) {
  std::string s = trim(text);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "y" || s == "yes") return true;
  if (s == "n" || s == "no")  return false;
  return std::nullopt;
}

std::optional<double> parse_number(const std::string& text) {
  const std::string s = trim(text);
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  errno = 0;
  const double v = std::strtod(s.c_str(), &end);
  if (errno != 0 || end != s.c_str() + s.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

std::optional<double> parse_wait_hours(const std::string& text) {
  auto v = parse_number(text);
  if (v && *v < 0.0) return std::nullopt;
  return v;
}

} // namespace sighting
