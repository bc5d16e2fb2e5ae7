#include "dm/hash.hpp"
#include <catch2/catch.hpp>
#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

using dm::DigestEngine;
using dm::Variant;
using dm::digest_of;

TEST_CASE("StandardDigest known vectors") {
  REQUIRE(digest_of(std::string()) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  REQUIRE(digest_of("abc") ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  REQUIRE(digest_of("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
          "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
  REQUIRE(digest_of("Hello, world") ==
          "4ae7c3b6ac0beff671efa8cf57386151c06e58ca53a78d83f36107316cec125f");
}

TEST_CASE("StandardDigest around the padding boundary") {
  REQUIRE(digest_of(std::string(55, 'a')) ==
          "9f4390f8d30c2dd92ec9f095b65e2b9ae9b0a925a5258e241c9f1e910f734318");
  REQUIRE(digest_of(std::string(56, 'a')) ==
          "b35439a4ac6f0948b6d6f9e3c6af0f5f590ce20f1bde7090ef7970686ec6738a");
  REQUIRE(digest_of(std::string(64, 'a')) ==
          "ffe054fe7ae0cb6dc65c3af9b61d5209f439851db43d0ba5997337df154668eb");
}

TEST_CASE("StandardDigest of one million 'a'") {
  DigestEngine e;
  const std::string chunk(1000, 'a');
  for (int i = 0; i < 1000; ++i)
    e.update(chunk);
  REQUIRE(e.hexdigest() ==
          "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_CASE("Streaming in odd chunks matches one-shot") {
  std::vector<std::uint8_t> msg;
  for (int r = 0; r < 3; ++r)
    for (int i = 0; i < 256; ++i)
      msg.push_back(static_cast<std::uint8_t>(i));
  const std::string expected =
      "f3a25aa93aa2fbba28d79260535bbd6a5eb0fc1c24a8b0f04e12b484c1dfe363";
  REQUIRE(digest_of(msg) == expected);

  for (std::size_t step : {1u, 7u, 63u, 64u, 65u, 200u}) {
    DigestEngine e;
    for (std::size_t off = 0; off < msg.size(); off += step) {
      const std::size_t n = std::min(step, msg.size() - off);
      e.update(msg.data() + off, n);
      REQUIRE(e.buffered() < 64);
    }
    REQUIRE(e.hexdigest() == expected);
  }
}

TEST_CASE("digest() is non-destructive and idempotent") {
  DigestEngine e;
  e.update("abc");
  const std::string first = e.hexdigest();
  REQUIRE(e.hexdigest() == first);
  REQUIRE(first == digest_of("abc"));

  // Continues the stream from before the digest() call.
  e.update("def");
  REQUIRE(e.hexdigest() ==
          "bef57ec7f53a6d40beb640a780a639c83bc29ac8a9816f1fc6c5c6dcd93c4721");
}

TEST_CASE("reset() returns to the initial constants") {
  DigestEngine e;
  e.update("some unrelated message that spans more than one block .........");
  e.reset();
  REQUIRE(e.buffered() == 0);
  REQUIRE(e.hexdigest() == digest_of(std::string()));
  e.update("abc");
  REQUIRE(e.hexdigest() == digest_of("abc"));
}

TEST_CASE("Output is always 64 lowercase hex characters") {
  for (std::size_t len : {0u, 1u, 55u, 56u, 64u, 119u, 1000u}) {
    for (auto v : {Variant::Standard, Variant::FastMix}) {
      const std::string h = digest_of(std::string(len, 'x'), v);
      REQUIRE(h.size() == 64);
      REQUIRE(h.find_first_not_of("0123456789abcdef") == std::string::npos);
    }
  }
}

TEST_CASE("Null data with a nonzero length is rejected") {
  DigestEngine e;
  REQUIRE_THROWS_AS(e.update(nullptr, 4), dm::InputTypeError);
  REQUIRE_NOTHROW(e.update(nullptr, 0));
  REQUIRE(e.hexdigest() == digest_of(std::string()));
}

TEST_CASE("StandardDigest avalanche averages about half the output bits") {
  std::mt19937 rng(12345);
  const std::string alphabet =
      "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);

  auto bit_difference = [](const dm::Digest& a, const dm::Digest& b) {
    int n = 0;
    for (std::size_t i = 0; i < a.bytes.size(); ++i)
      n += __builtin_popcount(static_cast<unsigned>(a.bytes[i] ^ b.bytes[i]));
    return n;
  };

  const int trials = 400;
  long total_std = 0, total_mix = 0;
  for (int t = 0; t < trials; ++t) {
    std::string s1;
    for (int i = 0; i < 10; ++i)
      s1 += alphabet[pick(rng)];
    std::string s2 = s1;
    s2.back() = static_cast<char>(s2.back() ^ 1);

    for (auto v : {Variant::Standard, Variant::FastMix}) {
      DigestEngine a(v), b(v);
      a.update(s1);
      b.update(s2);
      const int diff = bit_difference(a.digest(), b.digest());
      (v == Variant::Standard ? total_std : total_mix) += diff;
    }
  }
  const double avg_std = double(total_std) / trials;
  const double avg_mix = double(total_mix) / trials;
  INFO("standard avg " << avg_std << ", fastmix avg " << avg_mix);
  REQUIRE(avg_std > 120.0);
  REQUIRE(avg_std < 136.0);
  REQUIRE(avg_mix > 0.0);
}
