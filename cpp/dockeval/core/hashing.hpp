#pragma once
/*
================================================================================
Fragment 1.5 - Core: Hashing Utilities
FILE: cpp/dockeval/core/hashing.hpp

Purpose:
  - Stable, deterministic 64-bit hashing (FNV-1a) for in-memory cache keys
    (reference-statistics memoization across grading calls).
  - SHA-256 hex digests for persisted identities (Flight ID).

Design constraints:
  - No dependence on std::hash (not stable across processes/platforms).
  - Avoid UB: use std::bit_cast for floating types, normalize NaNs.

Notes:
  - Fnv1a64 is NOT cryptographic. Flight IDs use SHA-256 (OpenSSL EVP) so
    that they match IDs already stored in historical databases.
================================================================================
*/

#include <array>
#include <bit>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dockeval {

// ----------------------------- FNV-1a 64 -------------------------------------
class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime       = 1099511628211ull;

  Fnv1a64() : h_(kOffsetBasis) {}
  explicit Fnv1a64(uint64_t seed) : h_(seed ? seed : kOffsetBasis) {}

  uint64_t value() const { return h_; }

  void update_bytes(const void* data, size_t n);

  void update_u8(uint8_t v) { update_bytes(&v, 1); }
  void update_u64(uint64_t v) { update_le(v); }
  void update_bool(bool b) { update_u8(static_cast<uint8_t>(b ? 1 : 0)); }

  // Strings are length-delimited to avoid ambiguity.
  void update_string(std::string_view s);

  // Canonical float hashing (-0.0 -> +0.0, NaN -> fixed payload).
  void update_f64(double x);
  void update_f64_vec(const std::vector<double>& v);

 private:
  template <class T>
  void update_le(T v) {
    static_assert(std::is_integral_v<T> && sizeof(T) == 8, "update_le supports 64-bit integral types only");
    std::array<uint8_t, sizeof(T)> b{};
    for (size_t i = 0; i < sizeof(T); ++i) {
      b[i] = static_cast<uint8_t>((static_cast<uint64_t>(v) >> (8 * i)) & 0xFFu);
    }
    update_bytes(b.data(), b.size());
  }

  uint64_t h_;
};

// SHA-256 of the bytes of s, as 64-char lowercase hex. Throws DockevalError if
// the digest backend fails.
std::string sha256_hex(std::string_view s);

}  // namespace dockeval
