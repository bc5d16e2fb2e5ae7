// include/dm/constants.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "dm.hpp"

namespace dm {

inline constexpr std::size_t kBlockBytes = 64;
inline constexpr std::size_t kDigestBytes = 32;

// First 32 bits of the fractional parts of the cube roots of the first 64
// primes.
inline constexpr std::array<std::uint32_t, 64> kStandardRoundConstants = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu,
    0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u, 0xd807aa98u, 0x12835b01u,
    0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u,
    0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu,
    0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u,
    0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u,
    0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u,
    0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u, 0x1e376c08u,
    0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu,
    0x682e6ff3u, 0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u,
    0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

// First 32 bits of the fractional parts of the square roots of the first 8
// primes.
inline constexpr std::array<std::uint32_t, 8> kStandardInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

// Two 128-bit constant pairs (sqrt(2) and sqrt(3) derived).
inline constexpr std::array<std::uint64_t, 4> kFastMixInitialState = {
    0x6a09e667f3bcc908ull, 0xbb67ae8584caa73bull, // sqrt(2)
    0x3c6ef372fe94f82bull, 0xa54ff53a5f1d36f1ull  // sqrt(3)
};

// Fresh copies; the tables above are never written through.
constexpr std::array<std::uint32_t, 8> standard_initial_state() noexcept {
  return kStandardInitialState;
}
constexpr std::array<std::uint64_t, 4> fastmix_initial_state() noexcept {
  return kFastMixInitialState;
}

constexpr unsigned fastmix_rounds(MiningMode m) noexcept {
  switch (m) {
  case MiningMode::Fast:
    return 2;
  case MiningMode::Secure:
    return 4;
  case MiningMode::Standard:
  default:
    return 3;
  }
}

// Shape of a variant as selected by (variant, mode).
struct VariantTraits {
  unsigned word_bits;
  std::size_t block_bytes;
  std::size_t state_words;
  unsigned rounds;

  constexpr std::size_t digest_hex_length() const noexcept {
    return 2 * state_words * (word_bits / 8);
  }
};

constexpr VariantTraits traits(Variant v, MiningMode m) noexcept {
  return v == Variant::Standard
             ? VariantTraits{32, kBlockBytes, 8, 64}
             : VariantTraits{64, kBlockBytes, 4, fastmix_rounds(m)};
}

} // namespace dm
