// include/dm/padding.hpp
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dm {

// StandardDigest framing: message ++ 0x80 ++ zeros ++ be64(8 * nbytes).
// The result is a positive multiple of 64 bytes (64 for an empty message).
std::vector<std::uint8_t> pad_message(const void* data, std::size_t nbytes);

// Frames only the unprocessed tail of a longer message. `message_bytes` is the
// length of the whole message, of which `tail` holds the last
// `message_bytes % 64` bytes. Yields one or two blocks.
std::vector<std::uint8_t> pad_tail(const std::uint8_t* tail,
                                   std::size_t tail_len,
                                   std::uint64_t message_bytes);

// Big-endian bit length trailer; wraps modulo 2^64.
std::array<std::uint8_t, 8> length_trailer(std::uint64_t message_bytes) noexcept;

} // namespace dm
