#pragma once
/*
===========================================================
Fragment 1.1 - Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Minimal, dependency-free logging shared by the sizer, dispatch,
    economics, planning and solver layers.
  - One line per record: "[UTC time][LEVEL] message".

Routing:
  - Default: DEBUG/INFO to stdout, WARN/ERROR to stderr.
  - set_log_stream(&s): every record goes to s. The CLI points this at
    stderr whenever result JSON is written to stdout.

Hardening:
  - Logging MUST NOT throw (noexcept API).
  - Thread-safe (coarse mutex in implementation) so independent
    scenario evaluations on worker threads stay readable.
===========================================================
*/

#include <iosfwd>
#include <string>
#include <string_view>

namespace powerplan {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Global verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// "debug" / "info" / "warn" / "error". false on anything else, *out untouched.
bool parse_log_level(std::string_view s, LogLevel* out) noexcept;

// nullptr restores the default stdout/stderr split. The stream must outlive
// every log() call made while it is installed.
void set_log_stream(std::ostream* os) noexcept;

void log(LogLevel lvl, const std::string& msg) noexcept;

// Restores the previous level on scope exit.
class ScopedLogLevel {
 public:
  explicit ScopedLogLevel(LogLevel lvl) noexcept : saved_(get_log_level()) { set_log_level(lvl); }
  ~ScopedLogLevel() { set_log_level(saved_); }

  ScopedLogLevel(const ScopedLogLevel&) = delete;
  ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

 private:
  LogLevel saved_;
};

} // namespace powerplan
