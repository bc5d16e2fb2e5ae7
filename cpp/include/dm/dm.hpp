// include/dm/dm.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace dm {

// Bump when the digest or mining contract changes (handy for logging/UI).
inline constexpr const char* DM_VERSION = "0.1.0";

enum class Variant { Standard, FastMix };

// FastMix round selection. StandardDigest ignores it.
enum class MiningMode { Fast, Standard, Secure };

// Input could not be read as bytes (null data with a nonzero length, or a
// foreign object at the Python boundary).
class InputTypeError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Block-header field of the wrong width, or a hash of the wrong size.
class FormatError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

const char* variant_name(Variant v) noexcept;
const char* mode_name(MiningMode m) noexcept;

// Case-insensitive. Throws std::invalid_argument on unknown names.
Variant parse_variant(const std::string& name);
MiningMode parse_mode(const std::string& name);

// Knobs for a single nonce search over `base_message ++ decimal(nonce)`.
struct SearchConfig {
  Variant variant = Variant::Standard;
  MiningMode mode = MiningMode::Standard;
  std::string base_message;
  std::uint32_t leading_zeros = 0;        // required '0' hex prefix length
  std::uint64_t max_nonce = 10000000;     // nonces tried: [0, max_nonce)
  bool enable_progress = true;            // allow callbacks
  std::uint64_t progress_stride = 0;      // 0 = auto (~1% of max_nonce)
  const std::atomic<bool>* cancel = nullptr; // checked once per nonce
};

// Found when `found` is set; otherwise the search ran out of nonces (or was
// cancelled) and `attempts` holds how many were tried.
struct MiningResult {
  bool found = false;
  std::uint64_t nonce = 0;
  std::string digest_hex;
  std::uint64_t attempts = 0;        // nonce + 1 when found
  std::uint64_t hashes_computed = 0; // actual work, across all workers
  std::uint64_t ns_elapsed = 0;      // wall-clock nanoseconds
  bool cancelled = false;
  std::string engine_info;           // e.g. "gmp:6.3.0; gcc:13.2.0; standard/standard"

  double elapsed_seconds() const noexcept;
  double hashes_per_second() const noexcept;
};

// Progress callback: nonce just tested and its digest.
using ProgressCb =
    std::function<void(std::uint64_t, const std::string& digest_hex)>;

// Sequential search; the returned nonce is the smallest qualifying one.
MiningResult search(const SearchConfig& cfg, ProgressCb cb = {});

// Same result as search(), spread over `workers` threads (0 = hardware
// concurrency). Progress callbacks are not issued.
MiningResult parallel_search(const SearchConfig& cfg, unsigned workers);

} // namespace dm
