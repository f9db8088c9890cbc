// ============================================================================
// prompt.hpp -- Input parsing and retry prompts for the interactive shell
//
// Parsers return std::nullopt on bad input instead of throwing; the prompt
// loop keeps asking until one succeeds or input runs out.
// ============================================================================
#pragma once
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>

namespace sighting {

/// Month from "MMDD" (or "MM"). Day, when given, must be 1..31.
std::optional<unsigned> parse_month_day(const std::string& text);

/// "Y"/"y"/"yes" => true, "N"/"n"/"no" => false.
std::optional<bool> parse_yes_no(const std::string& text);

/// Finite decimal number, whole line consumed.
std::optional<double> parse_number(const std::string& text);

/// Non-negative finite decimal number.
std::optional<double> parse_wait_hours(const std::string& text);

// ============================================================================
// Retry loop
// Writes `prompt`, reads a line, and returns the first value `parse` accepts.
// On rejection writes `retry` and asks again. Returns std::nullopt at end of
// input.
// ============================================================================
template<typename Parser>
auto prompt_until_valid(std::istream& in, std::ostream& out,
                        const std::string& prompt, const std::string& retry,
                        Parser&& parse)
    -> std::invoke_result_t<Parser, const std::string&> {
  std::string line;
  while (true) {
    out << prompt << std::flush;
    if (!std::getline(in, line)) return std::nullopt;
    if (auto v = parse(line)) return v;
    out << retry << '\n';
  }
}

} // namespace sighting
