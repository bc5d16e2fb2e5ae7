// src/block_header.cpp
#include "dm/block_header.hpp"
#include "dm/difficulty.hpp"
#include "dm/hash.hpp"

#include <cstring>
#include <string>
#include <utility>

namespace dm {
namespace {

inline void store_le32(std::uint8_t *p, std::uint32_t v) {
  p[0] = (std::uint8_t)(v);
  p[1] = (std::uint8_t)(v >> 8);
  p[2] = (std::uint8_t)(v >> 16);
  p[3] = (std::uint8_t)(v >> 24);
}
inline std::uint32_t load_le32(const std::uint8_t *p) {
  return (std::uint32_t)p[0] | (std::uint32_t)p[1] << 8 |
         (std::uint32_t)p[2] << 16 | (std::uint32_t)p[3] << 24;
}

void require_hash_width(const std::vector<std::uint8_t> &field,
                        const char *name) {
  if (field.size() != kHeaderHashBytes)
    throw FormatError(std::string(name) + " must be 32 bytes, got " +
                      std::to_string(field.size()));
}

} // namespace

std::array<std::uint8_t, kBlockHeaderBytes>
pack_block_header(const BlockHeader &h) {
  require_hash_width(h.prev_hash, "prev_hash");
  require_hash_width(h.merkle_root, "merkle_root");

  std::array<std::uint8_t, kBlockHeaderBytes> out{};
  std::uint8_t *p = out.data();
  store_le32(p, static_cast<std::uint32_t>(h.version));
  std::memcpy(p + 4, h.prev_hash.data(), kHeaderHashBytes);
  std::memcpy(p + 36, h.merkle_root.data(), kHeaderHashBytes);
  store_le32(p + 68, h.timestamp);
  store_le32(p + 72, h.bits);
  store_le32(p + 76, h.nonce);
  return out;
}

BlockHeader unpack_block_header(const std::uint8_t *data, std::size_t nbytes) {
  if (data == nullptr || nbytes != kBlockHeaderBytes)
    throw FormatError("block header must be 80 bytes, got " +
                      std::to_string(nbytes));
  BlockHeader h;
  h.version = static_cast<std::int32_t>(load_le32(data));
  h.prev_hash.assign(data + 4, data + 36);
  h.merkle_root.assign(data + 36, data + 68);
  h.timestamp = load_le32(data + 68);
  h.bits = load_le32(data + 72);
  h.nonce = load_le32(data + 76);
  return h;
}

std::string hash_block_header(const BlockHeader &h, MiningMode mode) {
  const auto packed = pack_block_header(h);
  return digest_of(packed.data(), packed.size(), Variant::FastMix, mode);
}

std::string hash_with_nonce(const void *data, std::size_t nbytes,
                            std::uint64_t nonce, MiningMode mode) {
  DigestEngine e(Variant::FastMix, mode);
  e.update(data, nbytes);
  e.mix_nonce(nonce);
  return e.hexdigest();
}

BlockMineResult mine_block(const std::vector<std::uint8_t> &header,
                           std::uint32_t target_zeros, std::uint64_t max_nonce,
                           MiningMode mode) {
  // Absorb the header once; each nonce starts from a copy of that state,
  // which is what a fresh engine fed the same header would hold.
  DigestEngine primed(Variant::FastMix, mode);
  primed.update(header);

  for (std::uint64_t nonce = 0; nonce < max_nonce; ++nonce) {
    DigestEngine e(primed);
    e.mix_nonce(nonce);
    std::string h = e.hexdigest();
    if (has_leading_zeros(h, target_zeros))
      return BlockMineResult{true, nonce, std::move(h)};
  }
  return BlockMineResult{};
}

bool verify_block(const std::vector<std::uint8_t> &header, std::uint64_t nonce,
                  const std::string &expected_hex, MiningMode mode) {
  const std::size_t want = traits(Variant::FastMix, mode).digest_hex_length();
  if (expected_hex.size() != want)
    throw FormatError("expected hash must be " + std::to_string(want) +
                      " hex characters, got " +
                      std::to_string(expected_hex.size()));
  return hash_with_nonce(header.data(), header.size(), nonce, mode) ==
         expected_hex;
}

} // namespace dm
