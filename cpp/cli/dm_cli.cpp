#include "dm/difficulty.hpp"
#include "dm/dm.hpp"
#include "dm/hash.hpp"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static void report(const dm::SearchConfig& cfg, const dm::MiningResult& res) {
  if (!res.found) {
    std::cout << "Could not find a matching hash after " << res.attempts
              << " attempts" << (res.cancelled ? " (cancelled)" : "") << "\n";
    return;
  }
  std::cout << "\nSuccess! Found matching hash:\n"
            << "Text: " << cfg.base_message << "\n"
            << "Nonce: " << res.nonce << "\n"
            << "Hash: " << res.digest_hex << "\n"
            << std::fixed << std::setprecision(4)
            << "Time taken: " << res.elapsed_seconds() << " seconds\n"
            << "Hashes calculated: " << res.hashes_computed << "\n"
            << std::setprecision(2)
            << "Hashes per second: " << res.hashes_per_second() << "\n"
            << "Engine: " << res.engine_info << "\n";
}

int main(int argc, char** argv) {
  // Flags: --variant=standard|fastmix, --mode=fast|standard|secure,
  //        --zeros=K, --max-nonce=N, --threads=T, --stride=S,
  //        --no-progress, --hash (digest only), --bench=N (repeat)
  std::vector<dm::Variant> variants;
  dm::MiningMode mode = dm::MiningMode::Standard;
  std::uint32_t zeros = 3;
  std::uint64_t max_nonce = 10000000, stride = 100000;
  unsigned threads = 1, repeats = 1;
  bool enable_progress = true, hash_only = false;
  std::vector<std::string> texts;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    try {
      if (a.rfind("--variant=", 0) == 0) {
        variants.push_back(dm::parse_variant(a.substr(10)));
      } else if (a.rfind("--mode=", 0) == 0) {
        mode = dm::parse_mode(a.substr(7));
      } else if (a.rfind("--zeros=", 0) == 0) {
        zeros = static_cast<std::uint32_t>(std::stoul(a.substr(8)));
      } else if (a.rfind("--max-nonce=", 0) == 0) {
        max_nonce = std::stoull(a.substr(12));
      } else if (a.rfind("--threads=", 0) == 0) {
        threads = static_cast<unsigned>(std::stoul(a.substr(10)));
      } else if (a.rfind("--stride=", 0) == 0) {
        stride = std::stoull(a.substr(9));
      } else if (a.rfind("--bench=", 0) == 0) {
        repeats = static_cast<unsigned>(std::stoul(a.substr(8)));
      } else if (a == "--no-progress") {
        enable_progress = false;
      } else if (a == "--hash") {
        hash_only = true;
      } else if (a.rfind("--", 0) == 0) {
        std::cerr << "skip '" << a << "': unknown flag\n";
      } else {
        texts.push_back(a);
      }
    } catch (const std::exception& e) {
      std::cerr << "skip '" << a << "': " << e.what() << "\n";
    }
  }
  if (texts.empty()) texts = {"Hello, world"};
  if (variants.empty()) variants = {dm::Variant::Standard, dm::Variant::FastMix};
  if (repeats == 0) repeats = 1;

  for (const auto& text : texts) {
    for (auto v : variants) {
      std::cout << dm::variant_name(v) << "\n";

      if (hash_only) {
        auto t0 = std::chrono::steady_clock::now();
        std::string h = dm::digest_of(text, v, mode);
        auto t1 = std::chrono::steady_clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
        std::cout << "Result for: " << text << "\n" << h << "\n"
                  << "Time taken(ns): " << ns << "\n";
        continue;
      }

      dm::SearchConfig cfg;
      cfg.variant = v;
      cfg.mode = mode;
      cfg.base_message = text;
      cfg.leading_zeros = zeros;
      cfg.max_nonce = max_nonce;
      cfg.enable_progress = enable_progress;
      cfg.progress_stride = stride;
      std::cout << "Target: " << zeros << " leading zeros (~"
                << dm::expected_attempts(zeros) << " attempts expected)\n";

      auto progress = [](std::uint64_t nonce, const std::string&) {
        std::cout << "Trying nonce: " << nonce + 1 << "\n";
      };

      std::uint64_t best = UINT64_MAX, sum = 0;
      for (unsigned r = 0; r < repeats; ++r) {
        auto res = (threads == 1)
                       ? dm::search(cfg, (enable_progress && repeats == 1)
                                             ? dm::ProgressCb(progress)
                                             : dm::ProgressCb{})
                       : dm::parallel_search(cfg, threads);
        sum += res.ns_elapsed;
        if (res.ns_elapsed < best) best = res.ns_elapsed;
        if (repeats == 1) report(cfg, res);
      }
      if (repeats > 1) {
        std::cout << dm::variant_name(v) << " bench repeats=" << repeats
                  << " | best(ns)=" << best << " | avg(ns)=" << (sum / repeats)
                  << "\n";
      }
    }
  }
  return 0;
}
