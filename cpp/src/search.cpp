// src/search.cpp
#include "dm/difficulty.hpp"
#include "dm/dm.hpp"
#include "dm/hash.hpp"
#include "dm/nonce_range.hpp"

#include <algorithm> // std::max
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <gmp.h>
#include <string>
#include <thread>
#include <vector>

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}

inline std::string engine_info(const dm::SearchConfig &cfg) {
  return std::string("gmp:") + (::gmp_version ? ::gmp_version : "?") + "; " +
         compiler_info() + "; " + dm::variant_name(cfg.variant) + "/" +
         dm::mode_name(cfg.mode);
}

inline std::uint64_t ns_since(std::chrono::steady_clock::time_point t0) {
  auto t1 = std::chrono::steady_clock::now();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
}

// Reuses one buffer for base ++ decimal(nonce).
class Candidate {
public:
  explicit Candidate(const std::string &base)
      : text_(base), base_len_(base.size()) {}
  const std::string &with(std::uint64_t nonce) {
    text_.resize(base_len_);
    text_ += std::to_string(nonce);
    return text_;
  }

private:
  std::string text_;
  std::size_t base_len_;
};
} // namespace

namespace dm {

double MiningResult::elapsed_seconds() const noexcept {
  return static_cast<double>(ns_elapsed) / 1e9;
}

double MiningResult::hashes_per_second() const noexcept {
  return ns_elapsed ? static_cast<double>(hashes_computed) / elapsed_seconds()
                    : 0.0;
}

MiningResult search(const SearchConfig &cfg, ProgressCb cb) {
  MiningResult out;
  out.engine_info = engine_info(cfg);

  // Effective progress stride (0 => auto ~1%).
  const std::uint64_t stride =
      (cfg.progress_stride != 0)
          ? cfg.progress_stride
          : std::max<std::uint64_t>(1, cfg.max_nonce / 100);

  auto t0 = std::chrono::steady_clock::now();

  NonceRange range(0, cfg.max_nonce, 1, cfg.cancel);
  Candidate candidate(cfg.base_message);
  std::uint64_t nonce = 0;
  while (range.next(nonce)) {
    // Fresh engine per attempt; nothing carries over between nonces.
    const std::string h =
        digest_of(candidate.with(nonce), cfg.variant, cfg.mode);
    ++out.hashes_computed;

    if (cb && cfg.enable_progress &&
        ((nonce + 1) % stride == 0 || nonce + 1 == cfg.max_nonce))
      cb(nonce, h);

    if (has_leading_zeros(h, cfg.leading_zeros)) {
      out.found = true;
      out.nonce = nonce;
      out.digest_hex = h;
      out.attempts = nonce + 1;
      break;
    }
  }

  if (!out.found) {
    out.attempts = out.hashes_computed;
    out.cancelled = range.cancelled();
  }
  out.ns_elapsed = ns_since(t0);
  return out;
}

MiningResult parallel_search(const SearchConfig &cfg, unsigned workers) {
  if (workers == 0)
    workers = std::max(1u, std::thread::hardware_concurrency());
  if (workers == 1)
    return search(cfg);

  struct Local {
    bool found = false;
    std::uint64_t nonce = 0;
    std::string digest_hex;
    std::uint64_t hashes = 0;
    std::exception_ptr error;
  };

  MiningResult out;
  out.engine_info = engine_info(cfg);
  auto t0 = std::chrono::steady_clock::now();

  // Lowest qualifying nonce seen so far; workers stop once past it, so every
  // nonce below the final value has been tested by some worker.
  std::atomic<std::uint64_t> best{cfg.max_nonce};
  std::vector<Local> locals(workers);
  std::vector<std::thread> pool;
  pool.reserve(workers);

  for (unsigned w = 0; w < workers; ++w) {
    pool.emplace_back([&cfg, &best, &locals, w, workers] {
      Local &mine = locals[w];
      try {
        NonceRange range =
            NonceRange::partition(w, workers, cfg.max_nonce, cfg.cancel);
        Candidate candidate(cfg.base_message);
        std::uint64_t nonce = 0;
        while (range.next(nonce)) {
          if (nonce >= best.load(std::memory_order_acquire))
            break;
          const std::string h =
              digest_of(candidate.with(nonce), cfg.variant, cfg.mode);
          ++mine.hashes;
          if (has_leading_zeros(h, cfg.leading_zeros)) {
            mine.found = true;
            mine.nonce = nonce;
            mine.digest_hex = h;
            std::uint64_t cur = best.load(std::memory_order_acquire);
            while (nonce < cur &&
                   !best.compare_exchange_weak(cur, nonce,
                                               std::memory_order_acq_rel))
              ;
            break;
          }
        }
      } catch (...) {
        mine.error = std::current_exception();
      }
    });
  }
  for (auto &t : pool)
    t.join();

  for (const auto &l : locals) {
    if (l.error)
      std::rethrow_exception(l.error);
    out.hashes_computed += l.hashes;
  }

  const std::uint64_t b = best.load();
  for (const auto &l : locals) {
    if (l.found && l.nonce == b) {
      out.found = true;
      out.nonce = b;
      out.digest_hex = l.digest_hex;
      out.attempts = b + 1;
      break;
    }
  }
  if (!out.found) {
    out.attempts = out.hashes_computed;
    out.cancelled = cfg.cancel && cfg.cancel->load();
  }
  out.ns_elapsed = ns_since(t0);
  return out;
}

} // namespace dm
