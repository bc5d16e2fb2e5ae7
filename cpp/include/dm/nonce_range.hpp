// include/dm/nonce_range.hpp
#pragma once
#include <atomic>
#include <cstdint>

namespace dm {

// Lazy, finite nonce generator: first, first+step, ... while < last.
// Restartable via reset(); stops early once the cancel flag is raised.
class NonceRange {
public:
  NonceRange(std::uint64_t first, std::uint64_t last, std::uint64_t step = 1,
             const std::atomic<bool>* cancel = nullptr);

  // Writes the next nonce and returns true, or returns false when the range
  // is exhausted or cancelled.
  bool next(std::uint64_t& nonce) noexcept;

  void reset() noexcept;
  bool cancelled() const noexcept;
  std::uint64_t yielded() const noexcept { return yielded_; }

  // Interleaved share `index` of `count` over [0, last).
  static NonceRange partition(unsigned index, unsigned count,
                              std::uint64_t last,
                              const std::atomic<bool>* cancel = nullptr);

private:
  std::uint64_t first_;
  std::uint64_t last_;
  std::uint64_t step_;
  std::uint64_t cursor_;
  std::uint64_t yielded_ = 0;
  bool done_ = false;
  const std::atomic<bool>* cancel_;
};

} // namespace dm
