#pragma once
/*
================================================================================
Fragment 1.5 - Core: Deterministic Hashing Utilities
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - Stable 64-bit fingerprints for scenarios (catalog + parameters + site +
    trajectory + workloads). Printed in hex as the result's scenario_id.

Design constraints:
  - No dependence on std::hash (not stable across processes/platforms).
  - Doubles hashed via bit pattern after canonicalization (-0.0 -> +0.0,
    NaN -> fixed quiet-NaN payload).
  - Explicit little-endian integer encoding.

Notes:
  - Not cryptographic.
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace powerplan {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

// ----------------------------- FNV-1a 64 -------------------------------------
class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  Fnv1a64() : h_(kOffsetBasis) {}

  Hash64 digest() const { return Hash64{h_}; }

  void update_bytes(const void* data, size_t n);

  void update_u64(uint64_t v) { update_le(v); }
  void update_i64(int64_t v)  { update_le(static_cast<uint64_t>(v)); }
  void update_bool(bool b) { const uint8_t v = b ? 1 : 0; update_bytes(&v, 1); }

  // Length-delimited to avoid ambiguity between adjacent strings.
  void update_string(std::string_view s);

  template <class E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void update_enum(E e) {
    update_i64(static_cast<int64_t>(static_cast<std::underlying_type_t<E>>(e)));
  }

  void update_f64(double x);

 private:
  void update_le(uint64_t v) {
    std::array<uint8_t, 8> b{};
    for (size_t i = 0; i < b.size(); ++i) {
      b[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFFu);
    }
    update_bytes(b.data(), b.size());
  }

  uint64_t h_;
};

// Hex encoding (16 lowercase chars, most significant nibble first).
std::string hash_to_hex(Hash64 h);

}  // namespace powerplan
