// ============================================================================
// config.cpp -- Configuration loading implementation
//
// This file implements the load_config function that reads configuration
// values from a TOML file and returns a Config struct, and the checks that
// reject unusable values before any estimator runs.
// ============================================================================
#include "config.hpp"
#include "errors.hpp"

#include <toml++/toml.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace sighting {

// ============================================================================
// Validate configuration
// ============================================================================
void Config::apply_data_paths(const std::string& sightings, const std::string& history) {
  if (!sightings.empty()) SIGHTINGS_PATH = sightings;
  if (!history.empty()) HISTORY_PATH = history;
  if (SIGHTINGS_PATH.empty()) {
    throw InvalidConfigurationError(
        "CONFIG: no sightings file on the command line or in data.SIGHTINGS_PATH");
  }
}

void Config::validate() const {
  if (!std::isfinite(SCALE) || SCALE <= 0.0) {
    throw InvalidConfigurationError("CONFIG: grid.SCALE must be positive");
  }
  if (!std::isfinite(DAILY_RANGE) || DAILY_RANGE < 0.0) {
    throw InvalidConfigurationError("CONFIG: bootstrap.DAILY_RANGE must be >= 0");
  }
  if (!std::isfinite(POINT_RADIUS) || POINT_RADIUS < 0.0) {
    throw InvalidConfigurationError("CONFIG: bootstrap.POINT_RADIUS must be >= 0");
  }
  if (TRIALS == 0) {
    throw InvalidConfigurationError("CONFIG: bootstrap.TRIALS must be > 0");
  }
  if (!std::isfinite(POD_DAILY_RANGE) || POD_DAILY_RANGE < 0.0) {
    throw InvalidConfigurationError("CONFIG: pods.DAILY_RANGE must be >= 0");
  }
  if (CATEGORIES.empty()) {
    throw InvalidConfigurationError("CONFIG: pods.CATEGORIES is empty");
  }
  for (auto it = CATEGORIES.begin(); it != CATEGORIES.end(); ++it) {
    if (it->empty()) {
      throw InvalidConfigurationError("CONFIG: pods.CATEGORIES has a blank label");
    }
    if (std::find(CATEGORIES.begin(), it, *it) != it) {
      throw InvalidConfigurationError("CONFIG: duplicate category '" + *it + "'");
    }
  }
}

// ============================================================================
// Load configuration from TOML file
// ============================================================================
Config load_config(const std::string& config_path) {
  Config cfg;

  try {
    auto tbl = toml::parse_file(config_path);

    // Input data
    if (auto v = tbl["data"]["SIGHTINGS_PATH"].value<std::string>()) cfg.SIGHTINGS_PATH = *v;
    if (auto v = tbl["data"]["HISTORY_PATH"].value<std::string>()) cfg.HISTORY_PATH = *v;

    // Density grid
    if (auto v = tbl["grid"]["SCALE"].value<double>()) cfg.SCALE = *v;

    // Area bootstrap
    if (auto v = tbl["bootstrap"]["DAILY_RANGE"].value<double>()) cfg.DAILY_RANGE = *v;
    if (auto v = tbl["bootstrap"]["POINT_RADIUS"].value<double>()) cfg.POINT_RADIUS = *v;
    if (auto v = tbl["bootstrap"]["TRIALS"].value<std::uint64_t>()) cfg.TRIALS = *v;
    if (auto v = tbl["bootstrap"]["SEED"].value<std::uint64_t>()) cfg.SEED = *v;

    // Pod classifier
    if (auto arr = tbl["pods"]["CATEGORIES"].as_array()) {
      std::vector<std::string> cats;
      arr->for_each([&cats](auto&& el) {
        if constexpr (toml::is_string<decltype(el)>) cats.push_back(*el);
      });
      cfg.CATEGORIES = std::move(cats);
    }
    if (auto v = tbl["pods"]["DAILY_RANGE"].value<double>()) cfg.POD_DAILY_RANGE = *v;

    // Shell
    if (auto v = tbl["main"]["VERBOSE"].value<bool>()) cfg.VERBOSE = *v;
    if (auto v = tbl["main"]["PRINT_METRICS"].value<bool>()) cfg.PRINT_METRICS = *v;

    std::printf("CONFIG: Loaded configuration from: %s\n", config_path.c_str());
  } catch (const toml::parse_error& err) {
    std::fprintf(stderr, "CONFIG: Error parsing config file '%s': %s\n",
                 config_path.c_str(), err.description().data());
    std::fprintf(stderr, "CONFIG: Using default configuration values.\n");
  } catch (const std::exception& err) {
    std::fprintf(stderr, "CONFIG: Error loading config file '%s': %s\n",
                 config_path.c_str(), err.what());
    std::fprintf(stderr, "CONFIG: Using default configuration values.\n");
  }

  return cfg;
}

} // namespace sighting
