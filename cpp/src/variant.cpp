// src/variant.cpp
#include "dm/dm.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

namespace dm {
namespace {
std::string lowered(const std::string &s) {
  std::string out(s);
  for (auto &c : out)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}
} // namespace

const char *variant_name(Variant v) noexcept {
  return v == Variant::Standard ? "standard" : "fastmix";
}

const char *mode_name(MiningMode m) noexcept {
  switch (m) {
  case MiningMode::Fast:
    return "fast";
  case MiningMode::Secure:
    return "secure";
  case MiningMode::Standard:
  default:
    return "standard";
  }
}

Variant parse_variant(const std::string &name) {
  const std::string n = lowered(name);
  if (n == "standard" || n == "sha256")
    return Variant::Standard;
  if (n == "fastmix" || n == "smhash")
    return Variant::FastMix;
  throw std::invalid_argument("unknown digest variant: " + name);
}

MiningMode parse_mode(const std::string &name) {
  const std::string n = lowered(name);
  if (n == "fast")
    return MiningMode::Fast;
  if (n == "standard")
    return MiningMode::Standard;
  if (n == "secure")
    return MiningMode::Secure;
  throw std::invalid_argument("unknown mining mode: " + name);
}

} // namespace dm
