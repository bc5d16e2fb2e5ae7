// src/padding.cpp
#include "dm/padding.hpp"
#include "dm/constants.hpp"

#include <cstring>

namespace dm {
namespace {

void append_padding(std::vector<std::uint8_t> &out,
                    std::uint64_t message_bytes) {
  out.push_back(0x80);
  // (bits + 64) mod 512 == 0  <=>  (bytes + 8) mod 64 == 0
  while ((out.size() + 8) % kBlockBytes != 0)
    out.push_back(0x00);
  const auto trailer = length_trailer(message_bytes);
  out.insert(out.end(), trailer.begin(), trailer.end());
}

} // namespace

std::array<std::uint8_t, 8>
length_trailer(std::uint64_t message_bytes) noexcept {
  const std::uint64_t bits = message_bytes * 8;
  std::array<std::uint8_t, 8> t{};
  for (int i = 0; i < 8; ++i)
    t[7 - i] = (std::uint8_t)(bits >> (8 * i));
  return t;
}

std::vector<std::uint8_t> pad_message(const void *data, std::size_t nbytes) {
  std::vector<std::uint8_t> out;
  out.reserve((nbytes / kBlockBytes + 2) * kBlockBytes);
  if (nbytes) {
    const auto *in = static_cast<const std::uint8_t *>(data);
    out.assign(in, in + nbytes);
  }
  append_padding(out, nbytes);
  return out;
}

std::vector<std::uint8_t> pad_tail(const std::uint8_t *tail,
                                   std::size_t tail_len,
                                   std::uint64_t message_bytes) {
  std::vector<std::uint8_t> out;
  out.reserve(2 * kBlockBytes);
  if (tail_len)
    out.assign(tail, tail + tail_len);
  append_padding(out, message_bytes);
  return out;
}

} // namespace dm
