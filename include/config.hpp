// ============================================================================
// config.hpp -- Configuration structure for the sighting estimator
//
// This header defines the Config struct that holds all configuration values
// for the estimators and the interactive shell, which can be loaded from a
// TOML configuration file.
// ============================================================================
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "area_bootstrap.hpp"

namespace sighting {

// ============================================================================
// Configuration structure
// ============================================================================
struct Config {
  // ========================================================================
  // Input data
  // HISTORY_PATH feeds the inter-arrival model; empty means reuse the
  // sightings file.
  // ========================================================================
  std::string SIGHTINGS_PATH {};
  std::string HISTORY_PATH   {};

  // ========================================================================
  // Density grid
  // ========================================================================
  double SCALE { 100.0 };   // bins per degree, ~1.1 km cells

  // ========================================================================
  // Area bootstrap
  // ========================================================================
  double                       DAILY_RANGE  { 1.0 };     // ~111 km daily range
  double                       POINT_RADIUS { 0.01 };    // ~1.1 km visibility
  std::uint64_t                TRIALS       { 100000 };
  std::optional<std::uint64_t> SEED         {};          // unset => nondeterministic

  // ========================================================================
  // Pod classifier
  // ========================================================================
  std::vector<std::string> CATEGORIES      { "J", "K", "L" };
  double                   POD_DAILY_RANGE { 1.0 };

  // ========================================================================
  // Shell / logging
  // ========================================================================
  bool VERBOSE       { false };
  bool PRINT_METRICS { true };

  // ========================================================================
  // Derived/computed values
  // ========================================================================
  BootstrapParams bootstrap_params() const {
    return BootstrapParams{DAILY_RANGE, POINT_RADIUS, TRIALS, SEED};
  }
  const std::string& history_path() const {
    return HISTORY_PATH.empty() ? SIGHTINGS_PATH : HISTORY_PATH;
  }

  /// Command-line paths win over [data]; empty arguments keep the config's.
  /// Throws InvalidConfigurationError if no sightings file is named by either.
  void apply_data_paths(const std::string& sightings, const std::string& history);

  /// Throws InvalidConfigurationError if any value is unusable.
  void validate() const;
};

// ============================================================================
// Load configuration from TOML file
// ============================================================================
Config load_config(const std::string& config_path);

} // namespace sighting
