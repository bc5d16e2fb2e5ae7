// include/dm/difficulty.hpp
#pragma once
#include <cstdint>
#include <string>

namespace dm {

// True iff the first k characters of `hex` are all '0'. False when the
// string is shorter than k.
bool has_leading_zeros(const std::string& hex, std::uint32_t k) noexcept;

// 16^k as an exact decimal string: the mean number of attempts needed for a
// k-zero prefix.
std::string expected_attempts(std::uint32_t k);

// Big-integer form of the prefix test for a 64-character digest: value of
// `hex` < 2^(256 - 4k). Throws FormatError on malformed or mis-sized hex.
bool meets_target(const std::string& hex, std::uint32_t k);

} // namespace dm
