// include/dm/block_header.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dm.hpp"

namespace dm {

inline constexpr std::size_t kBlockHeaderBytes = 80;
inline constexpr std::size_t kHeaderHashBytes = 32;

// Packed little-endian as
//   version:i32 | prev_hash:32 | merkle_root:32 | timestamp:u32 | bits:u32 | nonce:u32
struct BlockHeader {
  std::int32_t version = 1;
  std::vector<std::uint8_t> prev_hash;   // exactly 32 bytes
  std::vector<std::uint8_t> merkle_root; // exactly 32 bytes
  std::uint32_t timestamp = 0;
  std::uint32_t bits = 0;
  std::uint32_t nonce = 0;
};

// Throws FormatError if either hash field is not 32 bytes.
std::array<std::uint8_t, kBlockHeaderBytes>
pack_block_header(const BlockHeader& h);

// Throws FormatError unless nbytes == 80.
BlockHeader unpack_block_header(const std::uint8_t* data, std::size_t nbytes);

// FastMix digest of the packed header.
std::string hash_block_header(const BlockHeader& h,
                              MiningMode mode = MiningMode::Standard);

// FastMix: update(data), mix_nonce(nonce), hexdigest() on a fresh engine.
std::string hash_with_nonce(const void* data, std::size_t nbytes,
                            std::uint64_t nonce,
                            MiningMode mode = MiningMode::Fast);

struct BlockMineResult {
  bool found = false;
  std::uint64_t nonce = 0;
  std::string digest_hex; // empty when not found
};

// Smallest nonce in [0, max_nonce) whose hash_with_nonce digest starts with
// `target_zeros` '0' characters.
BlockMineResult mine_block(const std::vector<std::uint8_t>& header,
                           std::uint32_t target_zeros,
                           std::uint64_t max_nonce = 1ull << 32,
                           MiningMode mode = MiningMode::Fast);

// Re-derives the digest for (header, nonce). Throws FormatError if
// `expected_hex` is not a 64-character digest.
bool verify_block(const std::vector<std::uint8_t>& header, std::uint64_t nonce,
                  const std::string& expected_hex,
                  MiningMode mode = MiningMode::Fast);

} // namespace dm
