// src/compress.cpp
#include "dm/constants.hpp"

#include <array>
#include <cstdint>

namespace dm {
namespace {

inline constexpr std::uint32_t rotr32(std::uint32_t x, int n) {
  return (x >> n) | (x << (32 - n));
}
inline constexpr std::uint64_t rotr64(std::uint64_t x, int n) {
  return (x >> n) | (x << (64 - n));
}
inline constexpr std::uint64_t rotl64(std::uint64_t x, int n) {
  return (x << n) | (x >> (64 - n));
}

inline std::uint32_t load_be32(const std::uint8_t *p) {
  return (std::uint32_t)p[0] << 24 | (std::uint32_t)p[1] << 16 |
         (std::uint32_t)p[2] << 8 | (std::uint32_t)p[3];
}
inline std::uint64_t load_be64(const std::uint8_t *p) {
  return (std::uint64_t)load_be32(p) << 32 | load_be32(p + 4);
}

} // namespace

// ---- StandardDigest: one 64-byte block into the eight chaining words ----
void compress_standard(std::array<std::uint32_t, 8> &H,
                       const std::uint8_t *block) noexcept {
  const auto &K = kStandardRoundConstants;
  std::uint32_t w[64];
  for (int i = 0; i < 16; ++i)
    w[i] = load_be32(block + 4 * i);
  for (int i = 16; i < 64; ++i) {
    std::uint32_t s0 =
        rotr32(w[i - 15], 7) ^ rotr32(w[i - 15], 18) ^ (w[i - 15] >> 3);
    std::uint32_t s1 =
        rotr32(w[i - 2], 17) ^ rotr32(w[i - 2], 19) ^ (w[i - 2] >> 10);
    w[i] = w[i - 16] + s0 + w[i - 7] + s1;
  }
  std::uint32_t a = H[0], b = H[1], c = H[2], d = H[3], e = H[4], f = H[5],
                g = H[6], h = H[7];
  for (int i = 0; i < 64; ++i) {
    std::uint32_t S1 = rotr32(e, 6) ^ rotr32(e, 11) ^ rotr32(e, 25);
    std::uint32_t ch = (e & f) ^ (~e & g);
    std::uint32_t t1 = h + S1 + ch + K[i] + w[i];
    std::uint32_t S0 = rotr32(a, 2) ^ rotr32(a, 13) ^ rotr32(a, 22);
    std::uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
    std::uint32_t t2 = S0 + maj;
    h = g;
    g = f;
    f = e;
    e = d + t1;
    d = c;
    c = b;
    b = a;
    a = t1 + t2;
  }
  H[0] += a;
  H[1] += b;
  H[2] += c;
  H[3] += d;
  H[4] += e;
  H[5] += f;
  H[6] += g;
  H[7] += h;
}

// ---- FastMix: ARX pair mixer ----
void fastmix_pair(std::uint64_t &x, std::uint64_t &y) noexcept {
  x = rotr64(x, 13) ^ y;
  y = rotl64(y, 17) ^ x;
  x = rotr64(x, 21) ^ y;
  y = rotl64(y, 29) ^ x;
}

void compress_fastmix(std::array<std::uint64_t, 4> &s,
                      const std::uint8_t *block, unsigned rounds) noexcept {
  std::uint64_t v[8];
  for (int i = 0; i < 8; ++i)
    v[i] = load_be64(block + 8 * i);

  s[0] ^= v[0] ^ v[4];
  s[1] ^= v[1] ^ v[5];
  s[2] ^= v[2] ^ v[6];
  s[3] ^= v[3] ^ v[7];

  for (unsigned r = 0; r < rounds; ++r) {
    fastmix_pair(s[0], s[1]);
    fastmix_pair(s[2], s[3]);
    // cross
    fastmix_pair(s[0], s[2]);
    fastmix_pair(s[1], s[3]);
  }
}

void fastmix_nonce(std::array<std::uint64_t, 4> &s,
                   std::uint64_t nonce) noexcept {
  s[0] ^= nonce;
  s[1] ^= rotr64(nonce, 32);
  fastmix_pair(s[0], s[1]);
  fastmix_pair(s[2], s[3]);
}

} // namespace dm
