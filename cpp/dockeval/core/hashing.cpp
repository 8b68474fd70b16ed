#include "dockeval/core/hashing.hpp"

#include "dockeval/core/errors.hpp"

#include <openssl/evp.h>

#include <bit>
#include <cmath>
#include <memory>

namespace dockeval {

namespace {

constexpr uint64_t kCanonicalQuietNaNBits = 0x7ff8000000000000ull;

double canonicalize(double v) {
  if (std::isnan(v)) return std::bit_cast<double>(kCanonicalQuietNaNBits);
  if (v == -0.0) return 0.0;
  return v;
}

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

} // namespace

void Fnv1a64::update_bytes(const void* data, size_t n) {
  const auto* p = static_cast<const uint8_t*>(data);
  if (p == nullptr || n == 0) return;

  for (size_t i = 0; i < n; ++i) {
    h_ ^= static_cast<uint64_t>(p[i]);
    h_ *= kPrime;
  }
}

void Fnv1a64::update_string(std::string_view s) {
  update_u64(static_cast<uint64_t>(s.size()));
  if (!s.empty()) update_bytes(s.data(), s.size());
}

void Fnv1a64::update_f64(double x) {
  update_u64(std::bit_cast<uint64_t>(canonicalize(x)));
}

void Fnv1a64::update_f64_vec(const std::vector<double>& v) {
  update_u64(static_cast<uint64_t>(v.size()));
  for (double x : v) update_f64(x);
}

std::string sha256_hex(std::string_view s) {
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) throw DockevalError("sha256_hex: EVP_MD_CTX_new failed");

  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int md_len = 0;

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), s.data(), s.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
    throw DockevalError("sha256_hex: digest computation failed");
  }

  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<size_t>(md_len) * 2);
  for (unsigned int i = 0; i < md_len; ++i) {
    out.push_back(kHex[(md[i] >> 4) & 0xF]);
    out.push_back(kHex[md[i] & 0xF]);
  }
  return out;
}

}  // namespace dockeval
