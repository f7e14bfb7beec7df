/*
===========================================================
Fragment 1.1 - Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
Notes:
  - Level and sink are atomics; the mutex only serializes writes.
  - Formatting happens before the lock is taken.
===========================================================
*/

#include "engine/core/logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <exception>
#include <iostream>
#include <mutex>

namespace powerplan {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};
std::atomic<std::ostream*> g_sink{nullptr};
std::mutex g_write_mu;

constexpr const char* kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

const char* level_name(LogLevel lvl) noexcept {
  const int i = static_cast<int>(lvl);
  return (i >= 0 && i <= 3) ? kLevelNames[i] : "INFO";
}

// "[2027-01-01T00:00:00Z]" into buf. Empty brackets if the clock cannot be read.
void format_stamp(char (&buf)[32]) noexcept {
  const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  const bool ok = gmtime_s(&tm, &tt) == 0;
#else
  const bool ok = gmtime_r(&tt, &tm) != nullptr;
#endif
  if (!ok || std::strftime(buf, sizeof buf, "[%Y-%m-%dT%H:%M:%SZ]", &tm) == 0) {
    buf[0] = '[';
    buf[1] = ']';
    buf[2] = '\0';
  }
}

} // namespace

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parse_log_level(std::string_view s, LogLevel* out) noexcept {
  if (!out) return false;
  for (int i = 0; i <= 3; ++i) {
    std::string_view name = kLevelNames[i];
    if (s.size() != name.size()) continue;
    bool same = true;
    for (size_t k = 0; k < s.size(); ++k) {
      if (s[k] != static_cast<char>(name[k] - 'A' + 'a')) {
        same = false;
        break;
      }
    }
    if (same) {
      *out = static_cast<LogLevel>(i);
      return true;
    }
  }
  return false;
}

void set_log_stream(std::ostream* os) noexcept {
  g_sink.store(os, std::memory_order_release);
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
  try {
    char stamp[32];
    format_stamp(stamp);
    std::string line;
    line.reserve(msg.size() + 48);
    line.append(stamp).append("[").append(level_name(lvl)).append("] ").append(msg).push_back('\n');

    std::ostream* sink = g_sink.load(std::memory_order_acquire);
    std::ostream& out = sink ? *sink : (lvl >= LogLevel::WARN ? std::cerr : std::cout);

    std::lock_guard<std::mutex> lk(g_write_mu);
    out << line;
    out.flush();
  } catch (const std::exception&) {
    // Allocation or stream failure: drop the record.
  }
}

} // namespace powerplan
