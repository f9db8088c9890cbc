// ============================================================================
// errors.hpp -- Error taxonomy for the sighting estimators
//
// Every estimator either returns a valid result or throws one of these. The
// recoverable ones (empty input, insufficient data, invalid argument) are
// meant to be caught by the caller and turned into a retry prompt; an invalid
// configuration is a programming error and ends the run.
// ============================================================================
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sighting {

/// Base class for all estimator failures.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// No events matched the requested filter.
class EmptyInputError : public Error {
public:
  using Error::Error;
};

/// Fewer than two distinct timestamps; no interval can be computed.
class InsufficientDataError : public Error {
public:
  using Error::Error;
};

/// Estimator configured with unusable parameters (e.g. no categories).
class InvalidConfigurationError : public Error {
public:
  using Error::Error;
};

/// Caller supplied a bad value (negative wait time, bad coordinate, ...).
class InvalidArgumentError : public Error {
public:
  using Error::Error;
};

// ============================================================================
// `MalformedRecordError` class
// A row of the input file could not be parsed. Carries the 1-based line.
// ============================================================================
class MalformedRecordError : public InvalidArgumentError {
public:
  MalformedRecordError(std::size_t line, const std::string& what)
  : InvalidArgumentError("line " + std::to_string(line) + ": " + what),
    line_{line} {}

  [[nodiscard]] std::size_t line() const noexcept { return line_; }

private:
  std::size_t line_;
};

} // namespace sighting
