// include/dm/hash.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "constants.hpp"
#include "dm.hpp"

namespace dm {

// Raw 256-bit output of either variant.
struct Digest {
  std::array<std::uint8_t, kDigestBytes> bytes{};
};

// Chaining words plus pending input. Only the array matching the engine's
// variant is live; the other stays zeroed.
struct DigestState {
  std::array<std::uint32_t, 8> standard{};
  std::array<std::uint64_t, 4> fastmix{};
  std::vector<std::uint8_t> buffer; // < 64 bytes between updates
  std::uint64_t total_bytes = 0;    // for the StandardDigest length trailer
};

// Incremental hasher bound to one variant and mode for its lifetime.
// Not thread-safe; use one engine per thread.
class DigestEngine {
public:
  explicit DigestEngine(Variant variant = Variant::Standard,
                        MiningMode mode = MiningMode::Standard);

  // Back to the variant's initial constants with an empty buffer.
  void reset();

  // Throws InputTypeError if data is null while nbytes > 0.
  void update(const void* data, std::size_t nbytes);
  void update(const std::string& s);
  void update(const std::vector<std::uint8_t>& v);

  // Finalizes a copy of the state; the engine itself is left untouched, so
  // later updates continue the same stream.
  Digest digest() const;
  std::string hexdigest() const;

  // FastMix only: folds a nonce into the live state. Unlike digest(), this
  // mutates the engine. Throws std::invalid_argument on a StandardDigest
  // engine.
  void mix_nonce(std::uint64_t nonce);

  Variant variant() const noexcept { return variant_; }
  MiningMode mode() const noexcept { return mode_; }
  std::size_t buffered() const noexcept { return state_.buffer.size(); }
  const DigestState& state() const noexcept { return state_; }

private:
  Variant variant_;
  MiningMode mode_;
  DigestState state_;
};

// One-shot digests over a fresh engine.
std::string digest_of(const void* data, std::size_t nbytes,
                      Variant variant = Variant::Standard,
                      MiningMode mode = MiningMode::Standard);
std::string digest_of(const std::string& s, Variant variant = Variant::Standard,
                      MiningMode mode = MiningMode::Standard);
std::string digest_of(const std::vector<std::uint8_t>& v,
                      Variant variant = Variant::Standard,
                      MiningMode mode = MiningMode::Standard);

// Lowercase hex encoding.
std::string to_hex(const Digest& d);
std::string to_hex(const std::uint8_t* data, std::size_t nbytes);

} // namespace dm
