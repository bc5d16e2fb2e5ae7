// src/hash.cpp
#include "dm/hash.hpp"
#include "dm/padding.hpp"

#include <algorithm> // std::min
#include <array>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace dm {
// Block compressors (src/compress.cpp; no public header exposure)
void compress_standard(std::array<std::uint32_t, 8> &H,
                       const std::uint8_t *block) noexcept;
void compress_fastmix(std::array<std::uint64_t, 4> &s,
                      const std::uint8_t *block, unsigned rounds) noexcept;
void fastmix_pair(std::uint64_t &x, std::uint64_t &y) noexcept;
void fastmix_nonce(std::array<std::uint64_t, 4> &s,
                   std::uint64_t nonce) noexcept;
} // namespace dm

namespace dm {
namespace {

inline void store_be32(std::uint8_t *p, std::uint32_t v) {
  p[0] = (std::uint8_t)(v >> 24);
  p[1] = (std::uint8_t)(v >> 16);
  p[2] = (std::uint8_t)(v >> 8);
  p[3] = (std::uint8_t)(v);
}
inline void store_be64(std::uint8_t *p, std::uint64_t v) {
  store_be32(p, (std::uint32_t)(v >> 32));
  store_be32(p + 4, (std::uint32_t)v);
}

DigestState initial_state(Variant v) {
  DigestState s;
  if (v == Variant::Standard)
    s.standard = standard_initial_state();
  else
    s.fastmix = fastmix_initial_state();
  s.buffer.reserve(kBlockBytes);
  return s;
}

// Pure finalization: consumes its own copy of the state.
Digest finalize(Variant v, MiningMode m, DigestState s) {
  Digest out;
  if (v == Variant::Standard) {
    const auto tail =
        pad_tail(s.buffer.data(), s.buffer.size(), s.total_bytes);
    for (std::size_t i = 0; i < tail.size(); i += kBlockBytes)
      compress_standard(s.standard, tail.data() + i);
    for (int i = 0; i < 8; ++i)
      store_be32(out.bytes.data() + 4 * i, s.standard[i]);
    return out;
  }

  // The trailing block is mixed even when the buffer is empty.
  std::uint8_t block[kBlockBytes];
  std::memset(block, 0, sizeof block);
  if (!s.buffer.empty())
    std::memcpy(block, s.buffer.data(), s.buffer.size());
  compress_fastmix(s.fastmix, block, fastmix_rounds(m));

  fastmix_pair(s.fastmix[0], s.fastmix[2]);
  fastmix_pair(s.fastmix[1], s.fastmix[3]);

  for (int i = 0; i < 4; ++i)
    store_be64(out.bytes.data() + 8 * i, s.fastmix[i]);
  return out;
}

} // namespace

DigestEngine::DigestEngine(Variant variant, MiningMode mode)
    : variant_(variant), mode_(mode), state_(initial_state(variant)) {}

void DigestEngine::reset() { state_ = initial_state(variant_); }

void DigestEngine::update(const void *data, std::size_t nbytes) {
  if (nbytes == 0)
    return;
  if (data == nullptr)
    throw InputTypeError("update: null data with nonzero length");

  const auto *in = static_cast<const std::uint8_t *>(data);
  auto &buf = state_.buffer;
  state_.total_bytes += nbytes;

  // Top up a partial block first, then compress straight from the input.
  if (!buf.empty()) {
    const std::size_t take = std::min(kBlockBytes - buf.size(), nbytes);
    buf.insert(buf.end(), in, in + take);
    in += take;
    nbytes -= take;
    if (buf.size() < kBlockBytes)
      return;
    if (variant_ == Variant::Standard)
      compress_standard(state_.standard, buf.data());
    else
      compress_fastmix(state_.fastmix, buf.data(), fastmix_rounds(mode_));
    buf.clear();
  }

  const std::size_t full = nbytes / kBlockBytes * kBlockBytes;
  if (variant_ == Variant::Standard) {
    for (std::size_t i = 0; i < full; i += kBlockBytes)
      compress_standard(state_.standard, in + i);
  } else {
    const unsigned rounds = fastmix_rounds(mode_);
    for (std::size_t i = 0; i < full; i += kBlockBytes)
      compress_fastmix(state_.fastmix, in + i, rounds);
  }
  buf.assign(in + full, in + nbytes);

#if defined(DM_ENABLE_DEBUG_INVARIANTS) || !defined(NDEBUG)
  if (buf.size() >= kBlockBytes)
    throw std::logic_error("digest invariant violated: buffer holds a block");
#endif
}

void DigestEngine::update(const std::string &s) { update(s.data(), s.size()); }

void DigestEngine::update(const std::vector<std::uint8_t> &v) {
  update(v.data(), v.size());
}

Digest DigestEngine::digest() const { return finalize(variant_, mode_, state_); }

std::string DigestEngine::hexdigest() const { return to_hex(digest()); }

void DigestEngine::mix_nonce(std::uint64_t nonce) {
  if (variant_ != Variant::FastMix)
    throw std::invalid_argument("nonce mixing requires the FastMix variant");
  fastmix_nonce(state_.fastmix, nonce);
}

std::string digest_of(const void *data, std::size_t nbytes, Variant variant,
                      MiningMode mode) {
  DigestEngine e(variant, mode);
  e.update(data, nbytes);
  return e.hexdigest();
}

std::string digest_of(const std::string &s, Variant variant, MiningMode mode) {
  return digest_of(s.data(), s.size(), variant, mode);
}

std::string digest_of(const std::vector<std::uint8_t> &v, Variant variant,
                      MiningMode mode) {
  return digest_of(v.data(), v.size(), variant, mode);
}

std::string to_hex(const std::uint8_t *data, std::size_t nbytes) {
  static const char *hex = "0123456789abcdef";
  std::string out;
  out.resize(nbytes * 2);
  for (std::size_t i = 0; i < nbytes; ++i) {
    out[2 * i] = hex[(data[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[data[i] & 0xF];
  }
  return out;
}

std::string to_hex(const Digest &d) {
  return to_hex(d.bytes.data(), d.bytes.size());
}

} // namespace dm
