/*
  Fragment 9.8 - Read-Through Cache Selftest

  Framework-free checks for ReadThroughCache with an injected clock:
    1) Hits do not call the loader; misses do.
    2) Entries expire after the TTL; ttl <= 0 never expires.
    3) LRU eviction keeps at most max_entries.
    4) A throwing loader leaves the cache unchanged.

  Run: ./read_through_cache_selftest (non-zero exit on failure)
*/

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "engine/io/read_through_cache.hpp"

namespace powerplan {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

using TimePoint = std::chrono::steady_clock::time_point;

void test_hits_and_ttl() {
  TimePoint now{};
  ReadThroughCache<int> cache(std::chrono::seconds(10), 8, [&now] { return now; });
  int loads = 0;
  auto loader = [&loads] { return ++loads; };

  expect_true(cache.get_or_load("a", loader) == 1, "First read loads");
  expect_true(cache.get_or_load("a", loader) == 1 && loads == 1, "Second read is a hit");

  now += std::chrono::seconds(9);
  expect_true(cache.peek("a").has_value(), "Entry alive before the TTL");

  now += std::chrono::seconds(1);
  expect_true(!cache.peek("a").has_value(), "peek treats an expired entry as absent");
  expect_true(cache.get_or_load("a", loader) == 2, "Expired entry reloads");

  const ReadThroughCacheStats st = cache.stats();
  expect_true(st.hits == 1 && st.misses == 2 && st.expirations == 1, "Stats count hits, misses and expirations");
}

void test_no_ttl() {
  TimePoint now{};
  ReadThroughCache<std::string> cache(std::chrono::milliseconds(0), 4, [&now] { return now; });
  (void)cache.get_or_load("k", [] { return std::string("v"); });
  now += std::chrono::hours(24 * 365);
  expect_true(cache.peek("k") == std::string("v"), "ttl 0 never expires");
}

void test_lru_eviction() {
  TimePoint now{};
  ReadThroughCache<int> cache(std::chrono::minutes(1), 2, [&now] { return now; });
  (void)cache.get_or_load("a", [] { return 1; });
  (void)cache.get_or_load("b", [] { return 2; });
  (void)cache.get_or_load("a", [] { return -1; });  // touch a
  (void)cache.get_or_load("c", [] { return 3; });   // evicts b

  expect_true(cache.size() == 2, "Size bounded by max_entries");
  expect_true(cache.peek("a") == 1 && cache.peek("c") == 3, "Recently used entries kept");
  expect_true(!cache.peek("b").has_value(), "Least recently used entry evicted");
  expect_true(cache.stats().evictions == 1, "Eviction counted");

  cache.invalidate("a");
  expect_true(!cache.peek("a").has_value() && cache.size() == 1, "invalidate drops one entry");
  cache.invalidate("missing");
  expect_true(cache.size() == 1, "invalidate of an absent key is a no-op");
  cache.clear();
  expect_true(cache.size() == 0, "clear empties the cache");
}

void test_throwing_loader() {
  ReadThroughCache<int> cache(std::chrono::minutes(1), 4);
  (void)cache.get_or_load("good", [] { return 7; });

  bool threw = false;
  try {
    (void)cache.get_or_load("bad", []() -> int { throw std::runtime_error("load failed"); });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  expect_true(threw, "Loader exception propagates");
  expect_true(cache.size() == 1 && !cache.peek("bad").has_value(), "Failed load stores nothing");
  expect_true(cache.peek("good") == 7, "Existing entries survive a failed load");
}

}  // namespace
}  // namespace powerplan

int main() {
  using namespace powerplan;

  test_hits_and_ttl();
  test_no_ttl();
  test_lru_eviction();
  test_throwing_loader();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
