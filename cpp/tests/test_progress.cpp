#include "dm/dm.hpp"
#include <catch2/catch.hpp>
#include <atomic>

TEST_CASE("Progress callback fires once per stride") {
  using dm::SearchConfig; using dm::search;

  std::atomic<unsigned> hits{0};
  auto cb = [&](std::uint64_t /*nonce*/, const std::string& /*digest*/) { ++hits; };

  SearchConfig cfg;
  cfg.base_message = "progress";
  cfg.leading_zeros = 64; // never satisfied
  cfg.max_nonce = 1000;
  cfg.progress_stride = 100;
  auto res = search(cfg, cb);
  REQUIRE_FALSE(res.found);
  REQUIRE(hits.load() == 10);
}

TEST_CASE("Auto stride is about one percent of the bound") {
  using dm::SearchConfig; using dm::search;

  std::atomic<unsigned> hits{0};
  auto cb = [&](std::uint64_t, const std::string&) { ++hits; };

  SearchConfig cfg;
  cfg.base_message = "progress";
  cfg.leading_zeros = 64;
  cfg.max_nonce = 500; // stride 5
  search(cfg, cb);
  REQUIRE(hits.load() == 100);
}

TEST_CASE("Disabled progress never calls back and does not change the result") {
  using dm::SearchConfig; using dm::search;

  std::atomic<unsigned> hits{0};
  auto cb = [&](std::uint64_t, const std::string&) { ++hits; };

  SearchConfig cfg;
  cfg.base_message = "Hello, world";
  cfg.leading_zeros = 2;
  cfg.progress_stride = 1;
  auto with = search(cfg, cb);
  REQUIRE(hits.load() == with.attempts);

  cfg.enable_progress = false;
  hits = 0;
  auto without = search(cfg, cb);
  REQUIRE(hits.load() == 0);
  REQUIRE(without.nonce == with.nonce);
  REQUIRE(without.digest_hex == with.digest_hex);
}
