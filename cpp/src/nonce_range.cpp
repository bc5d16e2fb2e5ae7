// src/nonce_range.cpp
#include "dm/nonce_range.hpp"

#include <stdexcept>

namespace dm {

NonceRange::NonceRange(std::uint64_t first, std::uint64_t last,
                       std::uint64_t step, const std::atomic<bool> *cancel)
    : first_(first), last_(last), step_(step), cursor_(first),
      cancel_(cancel) {
  if (step == 0)
    throw std::invalid_argument("nonce step must be >= 1");
}

bool NonceRange::next(std::uint64_t &nonce) noexcept {
  if (done_ || cursor_ >= last_)
    return false;
  if (cancel_ && cancel_->load(std::memory_order_relaxed))
    return false;
  nonce = cursor_;
  ++yielded_;
  // Stop instead of wrapping past 2^64 - 1.
  if (last_ - cursor_ <= step_)
    done_ = true;
  else
    cursor_ += step_;
  return true;
}

void NonceRange::reset() noexcept {
  cursor_ = first_;
  yielded_ = 0;
  done_ = false;
}

bool NonceRange::cancelled() const noexcept {
  return cancel_ && cancel_->load(std::memory_order_relaxed);
}

NonceRange NonceRange::partition(unsigned index, unsigned count,
                                 std::uint64_t last,
                                 const std::atomic<bool> *cancel) {
  if (count == 0 || index >= count)
    throw std::invalid_argument("partition index out of range");
  return NonceRange(index, last, count, cancel);
}

} // namespace dm
