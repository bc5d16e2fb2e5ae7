#include "dm/difficulty.hpp"
#include "dm/dm.hpp"
#include "dm/hash.hpp"
#include "dm/nonce_range.hpp"
#include <catch2/catch.hpp>
#include <atomic>
#include <string>
#include <vector>

using dm::MiningMode;
using dm::SearchConfig;
using dm::Variant;

namespace {
SearchConfig hello(std::uint32_t zeros, Variant v = Variant::Standard) {
  SearchConfig cfg;
  cfg.variant = v;
  cfg.base_message = "Hello, world";
  cfg.leading_zeros = zeros;
  cfg.enable_progress = false;
  return cfg;
}
} // namespace

TEST_CASE("Hello, world at three zeros") {
  auto res = dm::search(hello(3));
  REQUIRE(res.found);
  REQUIRE(res.nonce == 3582);
  REQUIRE(res.attempts == 3583);
  REQUIRE(res.hashes_computed == 3583);
  REQUIRE(res.digest_hex ==
          "00031d17e6d800fcad6619255ea3c2510fb553e0f953597ed1004e80a1d63787");
  REQUIRE(res.digest_hex == dm::digest_of("Hello, world3582"));
  REQUIRE_FALSE(res.engine_info.empty());
}

TEST_CASE("Returned nonce is the smallest qualifying one") {
  for (std::uint32_t k : {1u, 2u}) {
    auto res = dm::search(hello(k));
    REQUIRE(res.found);
    REQUIRE(dm::has_leading_zeros(res.digest_hex, k));
    for (std::uint64_t n = 0; n < res.nonce; ++n)
      REQUIRE_FALSE(dm::has_leading_zeros(
          dm::digest_of("Hello, world" + std::to_string(n)), k));
  }
  REQUIRE(dm::search(hello(1)).nonce == 12);
  REQUIRE(dm::search(hello(2)).nonce == 629);
}

TEST_CASE("FastMix search") {
  auto res = dm::search(hello(3, Variant::FastMix));
  REQUIRE(res.found);
  REQUIRE(res.nonce == 4257);
  REQUIRE(res.digest_hex ==
          "000ed8f7bb6c3e8f1228f11c99d42abcdcd445ba90db2a17184c0c3a83f2827b");
  REQUIRE(dm::search(hello(2, Variant::FastMix)).nonce == 33);
}

TEST_CASE("Zero leading zeros accepts the first nonce") {
  auto res = dm::search(hello(0));
  REQUIRE(res.found);
  REQUIRE(res.nonce == 0);
  REQUIRE(res.attempts == 1);
  REQUIRE(res.digest_hex == dm::digest_of("Hello, world0"));
}

TEST_CASE("Exhausted search reports NotFound, not an error") {
  auto cfg = hello(3);
  cfg.max_nonce = 3582; // the first hit is just out of range
  auto res = dm::search(cfg);
  REQUIRE_FALSE(res.found);
  REQUIRE_FALSE(res.cancelled);
  REQUIRE(res.attempts == 3582);
  REQUIRE(res.digest_hex.empty());

  cfg.max_nonce = 0;
  res = dm::search(cfg);
  REQUIRE_FALSE(res.found);
  REQUIRE(res.attempts == 0);
}

TEST_CASE("Impossible targets exhaust the bound") {
  auto cfg = hello(65);
  cfg.max_nonce = 50;
  auto res = dm::search(cfg);
  REQUIRE_FALSE(res.found);
  REQUIRE(res.attempts == 50);
}

TEST_CASE("Raised cancel flag stops the search") {
  std::atomic<bool> cancel{true};
  auto cfg = hello(3);
  cfg.cancel = &cancel;
  auto res = dm::search(cfg);
  REQUIRE_FALSE(res.found);
  REQUIRE(res.cancelled);
  REQUIRE(res.attempts == 0);

  auto par = dm::parallel_search(cfg, 3);
  REQUIRE_FALSE(par.found);
  REQUIRE(par.cancelled);
}

TEST_CASE("Cancelling from the progress callback") {
  std::atomic<bool> cancel{false};
  auto cfg = hello(64);
  cfg.max_nonce = 1000;
  cfg.enable_progress = true;
  cfg.progress_stride = 100;
  cfg.cancel = &cancel;
  auto res = dm::search(cfg, [&](std::uint64_t nonce, const std::string&) {
    if (nonce + 1 == 300)
      cancel = true;
  });
  REQUIRE_FALSE(res.found);
  REQUIRE(res.cancelled);
  REQUIRE(res.attempts == 300);
}

TEST_CASE("Parallel search agrees with the sequential minimum") {
  for (unsigned workers : {1u, 2u, 3u, 8u}) {
    auto res = dm::parallel_search(hello(3), workers);
    REQUIRE(res.found);
    REQUIRE(res.nonce == 3582);
    REQUIRE(res.attempts == 3583);
    REQUIRE(res.digest_hex ==
            "00031d17e6d800fcad6619255ea3c2510fb553e0f953597ed1004e80a1d63787");
    REQUIRE(res.hashes_computed >= 1);
  }

  auto fm = dm::parallel_search(hello(3, Variant::FastMix), 4);
  REQUIRE(fm.nonce == 4257);

  auto cfg = hello(65);
  cfg.max_nonce = 500;
  auto miss = dm::parallel_search(cfg, 4);
  REQUIRE_FALSE(miss.found);
  REQUIRE(miss.attempts == 500);
  REQUIRE(miss.hashes_computed == 500);
}

TEST_CASE("Throughput figures") {
  dm::MiningResult r;
  r.hashes_computed = 2000;
  r.ns_elapsed = 500000000;
  REQUIRE(r.elapsed_seconds() == 0.5);
  REQUIRE(r.hashes_per_second() == 4000.0);
  r.ns_elapsed = 0;
  REQUIRE(r.hashes_per_second() == 0.0);
}

TEST_CASE("NonceRange yields a bounded ascending sequence") {
  dm::NonceRange r(0, 5);
  std::vector<std::uint64_t> seen;
  std::uint64_t n = 0;
  while (r.next(n))
    seen.push_back(n);
  REQUIRE(seen == std::vector<std::uint64_t>{0, 1, 2, 3, 4});
  REQUIRE_FALSE(r.next(n));
  REQUIRE(r.yielded() == 5);

  r.reset();
  REQUIRE(r.next(n));
  REQUIRE(n == 0);
}

TEST_CASE("NonceRange partitions cover the range exactly once") {
  const std::uint64_t last = 23;
  std::vector<int> hits(last, 0);
  for (unsigned i = 0; i < 4; ++i) {
    auto part = dm::NonceRange::partition(i, 4, last);
    std::uint64_t n = 0, prev = 0;
    bool first = true;
    while (part.next(n)) {
      if (!first)
        REQUIRE(n > prev);
      first = false;
      prev = n;
      ++hits[n];
    }
  }
  for (int h : hits)
    REQUIRE(h == 1);
  REQUIRE_THROWS_AS(dm::NonceRange::partition(4, 4, last), std::invalid_argument);
  REQUIRE_THROWS_AS(dm::NonceRange(0, 10, 0), std::invalid_argument);
}

TEST_CASE("NonceRange does not wrap at the top of the range") {
  const std::uint64_t top = ~0ull;
  dm::NonceRange r(top - 3, top, 2);
  std::uint64_t n = 0;
  REQUIRE(r.next(n));
  REQUIRE(n == top - 3);
  REQUIRE(r.next(n));
  REQUIRE(n == top - 1);
  REQUIRE_FALSE(r.next(n));
}
