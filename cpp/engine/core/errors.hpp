#pragma once
/*
================================================================================
Fragment 1.9 - Core: Error Types
FILE: cpp/engine/core/errors.hpp

Purpose:
  - Uniform exception types for the planning engine.
  - Only configuration / programmer errors are raised. Infeasible plans and
    degenerate arithmetic are reported inside HeuristicResult instead.

Taxonomy:
  - ValidationError     : user-supplied record fails validate_or_throw()
  - ConfigurationError  : unknown problem type, missing catalog entry
  - IOError             : file read/write failures (loader, CLI, exports)

Hardening:
  - Small, dependency-free exceptions.
  - POWERPLAN_ENSURE / POWERPLAN_THROW prefix messages with file:line.
================================================================================
*/

#include <stdexcept>
#include <string>
#include <utility>

namespace powerplan {

// Base error for the engine.
class PowerPlanError : public std::runtime_error {
 public:
  explicit PowerPlanError(std::string msg) : std::runtime_error(std::move(msg)) {}
};

// Thrown when user/config input fails validation.
class ValidationError : public PowerPlanError {
 public:
  explicit ValidationError(std::string msg) : PowerPlanError(std::move(msg)) {}
};

// Thrown for unknown problem types or missing catalog entries. Not recoverable
// inside the engine.
class ConfigurationError : public PowerPlanError {
 public:
  explicit ConfigurationError(std::string msg) : PowerPlanError(std::move(msg)) {}
};

// Thrown for I/O or filesystem related issues.
class IOError : public PowerPlanError {
 public:
  explicit IOError(std::string msg) : PowerPlanError(std::move(msg)) {}
};

namespace detail {

template <class E>
[[noreturn]] inline void throw_at(const char* file, int line, const std::string& msg) {
  throw E(std::string(file) + ":" + std::to_string(line) + ": " + msg);
}

} // namespace detail

} // namespace powerplan

#define POWERPLAN_THROW(ERR, MSG) \
  ::powerplan::detail::throw_at<ERR>(__FILE__, __LINE__, (MSG))

#define POWERPLAN_ENSURE(EXPR, ERR, MSG)                                \
  do {                                                                  \
    if (!(EXPR)) {                                                      \
      ::powerplan::detail::throw_at<ERR>(__FILE__, __LINE__, (MSG));    \
    }                                                                   \
  } while (0)
