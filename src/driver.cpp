// ============================================================================
// `driver.cpp` -- Interactive shell for the sighting estimator
//
// Usage:
//   ./sighting-estimator <sightings.csv> [--history history.csv]
//                        [--config config.toml] [--seed N]
//
//  - Loads the sightings (and optionally a separate full history) CSV.
//  - Asks for a date (MMDD) and reports the densest sighting location for
//    that month, re-prompting on bad input or months without data.
//  - Optionally reports the encounter probability at that (or a custom)
//    location, the most likely pod, and waiting-time tail probabilities.
//  - Configuration can be loaded from a TOML file via --config flag (optional).
// ============================================================================
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "config.hpp"
#include "errors.hpp"
#include "estimator.hpp"
#include "event_store.hpp"
#include "prompt.hpp"

using sighting::Config;
using sighting::EventStore;
using sighting::GeoPoint;
using sighting::SightingEstimator;

static void usage(const char* argv0) {
  std::fprintf(stderr,
    "MAIN: Usage: %s [sightings.csv] [--history history.csv] [--config config.toml] [--seed N]\n"
    "The sightings file may instead come from [data] SIGHTINGS_PATH in the config.\n"
    "Example: %s data/orcaDataClean.csv --history data/orcaDataTotal.csv\n",
    argv0, argv0);
}

// ============================================================================
// Session stages. Each returns false when input has run out.
// ============================================================================
static bool choose_location(const GeoPoint& peak, GeoPoint& location) {
  auto use_peak = sighting::prompt_until_valid(std::cin, std::cout,
      "\nDo you want to use this location? Y/N: ", "Please answer Y or N.",
      sighting::parse_yes_no);
  if (!use_peak) return false;
  if (*use_peak) { location = peak; return true; }

  std::puts("Okay, enter any other coordinates.");
  auto lat = sighting::prompt_until_valid(std::cin, std::cout,
      "Latitude: ", "Latitude must be a number in [-90, 90].",
      [](const std::string& s) -> std::optional<double> {
        auto v = sighting::parse_number(s);
        if (v && (*v < -90.0 || *v > 90.0)) return std::nullopt;
        return v;
      });
  if (!lat) return false;
  auto lon = sighting::prompt_until_valid(std::cin, std::cout,
      "Longitude: ", "Longitude must be a number in [-180, 180].",
      [](const std::string& s) -> std::optional<double> {
        auto v = sighting::parse_number(s);
        if (v && (*v < -180.0 || *v > 180.0)) return std::nullopt;
        return v;
      });
  if (!lon) return false;
  location = GeoPoint{*lat, *lon};
  return true;
}

static std::optional<bool> ask(const char* question) {
  return sighting::prompt_until_valid(std::cin, std::cout, question,
                                      "Please answer Y or N.", sighting::parse_yes_no);
}

static bool waiting_time_stage(const SightingEstimator& est) {
  const sighting::InterArrivalModel model = est.fit();
  std::printf("The expected time to wait for the next sighting is %.3f hours.\n",
              model.mean_hours());
  std::puts("Enter a waiting time in hours to get the probability that it takes that long.");

  while (true) {
    auto t = sighting::prompt_until_valid(std::cin, std::cout,
        "Enter waiting time (hours): ", "Waiting time must be a non-negative number.",
        sighting::parse_wait_hours);
    if (!t) return false;
    std::printf("You would wait %g or more hours with probability %.3f.\n\n",
                *t, est.fit_and_query(*t));
    auto again = ask("Want to try another time? Y/N: ");
    if (!again) return false;
    if (!*again) return true;
  }
}

static int run_session(const SightingEstimator& est) {
  // Goal 1: month -> densest location. Loop until a month with data.
  unsigned month = 0;
  sighting::PeakLocation peak;
  while (true) {
    auto m = sighting::prompt_until_valid(std::cin, std::cout,
        "\nWhat date are you looking for a sighting? MMDD: ",
        "Invalid date format. Try again please.", sighting::parse_month_day);
    if (!m) return 0;
    try {
      peak = est.estimate_peak_location(sighting::by_month(*m));
      month = *m;
      break;
    } catch (const sighting::EmptyInputError&) {
      std::puts("No sightings recorded for that month. Try another time of year!");
    }
  }
  std::printf("\nNumber of historical sightings at best location: %llu.\n",
              (unsigned long long)peak.count);
  std::printf("The best location is (%.2f, %.2f).\n",
              peak.location.latitude, peak.location.longitude);

  GeoPoint location;
  if (!choose_location(peak.location, location)) return 0;
  const auto period = sighting::by_month(month);

  // Goal 2: encounter probability.
  auto go = ask("\nContinue to the probability of a sighting? Y/N: ");
  if (!go) return 0;
  if (*go) {
    std::printf("The probability of a sighting here is %.6f.\n",
                est.estimate_probability(location, period));
  }

  // Goal 3: most likely pod.
  go = ask("\nContinue to most likely pod? Y/N: ");
  if (!go) return 0;
  if (*go) {
    const auto d = est.classify(location, period);
    const auto& best = d.mode_entry();
    std::printf("\nIf you do see one, the most likely pod is %s, with probability %.3f.\n",
                best.category.c_str(), best.probability);
    std::printf("Per-pod probabilities (%llu nearby sightings):\n",
                (unsigned long long)d.nearby_events);
    for (const auto& e : d.entries) {
      std::printf("  %-6s probability=%.3f  presence=%.3f\n",
                  e.category.c_str(), e.probability, e.presence);
    }
  }

  // Goal 4: waiting time.
  go = ask("\nContinue to time until next sighting? Y/N: ");
  if (!go) return 0;
  if (*go) {
    try {
      if (!waiting_time_stage(est)) return 0;
    } catch (const sighting::InsufficientDataError& ex) {
      std::fprintf(stderr, "MAIN: %s\n", ex.what());
    }
  }

  std::puts("\nNice to chat with you. Hope you find what you are looking for!");
  return 0;
}

// ============================================================================
// Main
// ============================================================================
int main(int argc, char** argv) {
  std::string sightings_path;
  std::string history_path;
  std::string config_path;
  std::optional<std::uint64_t> seed;

  // Parse arguments: [sightings.csv] [--history file] [--config file] [--seed N]
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--history" || arg == "--config" || arg == "-c" || arg == "--seed")
        && i + 1 >= argc) {
      std::fprintf(stderr, "MAIN: Error: %s requires a value\n", arg.c_str());
      return 1;
    }
    if (arg == "--history") {
      history_path = argv[++i];
    } else if (arg == "--config" || arg == "-c") {
      config_path = argv[++i];
    } else if (arg == "--seed") {
      char* end = nullptr;
      const std::string v = argv[++i];
      const unsigned long long parsed = std::strtoull(v.c_str(), &end, 10);
      if (v.empty() || end != v.c_str() + v.size()) {
        std::fprintf(stderr, "MAIN: Error: Invalid seed value: %s\n", v.c_str());
        return 1;
      }
      seed = parsed;
    } else if (arg.empty() || arg[0] != '-') {
      if (!sightings_path.empty()) {
        std::fprintf(stderr, "MAIN: Error: Unexpected argument: %s\n", arg.c_str());
        usage(argv[0]);
        return 1;
      }
      sightings_path = arg;
    } else {
      std::fprintf(stderr, "MAIN: Error: Unknown argument: %s\n", arg.c_str());
      usage(argv[0]);
      return 1;
    }
  }

  // Default to configs/default.toml if no config specified and it exists
  if (config_path.empty()) {
    std::filesystem::path default_config = "configs/default.toml";
    if (std::filesystem::exists(default_config)) {
      config_path = default_config.string();
    }
  }

  Config cfg;
  if (!config_path.empty()) {
    cfg = sighting::load_config(config_path);
  } else {
    std::printf("MAIN: Using default configuration (no config file specified).\n");
  }
  try {
    cfg.apply_data_paths(sightings_path, history_path);
  } catch (const sighting::InvalidConfigurationError& ex) {
    std::fprintf(stderr, "MAIN: Error: %s\n", ex.what());
    usage(argv[0]);
    return 1;
  }
  if (seed) cfg.SEED = seed;

  try {
    EventStore sightings = EventStore::load_csv(cfg.SIGHTINGS_PATH);
    std::printf("MAIN: Loaded %zu sightings from %s\n",
                sightings.size(), cfg.SIGHTINGS_PATH.c_str());

    EventStore history = sightings;
    if (cfg.history_path() != cfg.SIGHTINGS_PATH) {
      history = EventStore::load_csv(cfg.history_path(), sighting::RecordLayout::DatesOnly);
      std::printf("MAIN: Loaded %zu history events from %s\n",
                  history.size(), cfg.history_path().c_str());
    }

    SightingEstimator est(cfg, std::move(sightings), std::move(history));
    const int rc = run_session(est);
    if (cfg.PRINT_METRICS) est.metrics().print(stdout);
    return rc;
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "MAIN: FATAL: %s\n", ex.what());
    return 1;
  }
}
