// src/difficulty.cpp
#include "dm/difficulty.hpp"
#include "dm/dm.hpp"

#include <cctype>
#include <cstdint>
#include <gmp.h>
#include <memory>
#include <string>

namespace dm {

bool has_leading_zeros(const std::string &hex, std::uint32_t k) noexcept {
  if (hex.size() < k)
    return false;
  for (std::uint32_t i = 0; i < k; ++i)
    if (hex[i] != '0')
      return false;
  return true;
}

std::string expected_attempts(std::uint32_t k) {
  mpz_t n;
  mpz_init(n);
  mpz_ui_pow_ui(n, 16, k);

  // +2 for sign and NUL
  std::unique_ptr<char[]> buf(new char[mpz_sizeinbase(n, 10) + 2]);
  mpz_get_str(buf.get(), 10, n);
  mpz_clear(n);
  return std::string(buf.get());
}

bool meets_target(const std::string &hex, std::uint32_t k) {
  if (hex.size() != 64)
    throw FormatError("digest must be 64 hex characters, got " +
                      std::to_string(hex.size()));
  if (k > 64)
    return false;

  for (char c : hex)
    if (!std::isxdigit(static_cast<unsigned char>(c)))
      throw FormatError("digest is not valid hex: " + hex);

  mpz_t value, bound;
  if (mpz_init_set_str(value, hex.c_str(), 16) != 0) {
    mpz_clear(value);
    throw FormatError("digest is not valid hex: " + hex);
  }

  // bound = 2^(256 - 4k); k leading zero nibbles <=> value < bound
  mpz_init_set_ui(bound, 1);
  mpz_mul_2exp(bound, bound, 256 - 4 * k);
  const bool ok = mpz_cmp(value, bound) < 0;

  mpz_clear(value);
  mpz_clear(bound);
  return ok;
}

} // namespace dm
