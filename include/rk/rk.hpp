// include/rk/rk.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace rk {

// Shown by the CLI and embedded in RKResult::engine_info.
inline constexpr const char* RK_VERSION = "0.1.0";

inline constexpr const char* DEFAULT_OUTPUT_FILE = "keys.txt";
inline constexpr unsigned DEFAULT_KEY_LENGTH = 12;
inline constexpr std::uint64_t DEFAULT_START = 0x0;
inline constexpr std::uint64_t DEFAULT_END = 0xFFFFFFFFFFFFull;
inline constexpr unsigned MAX_KEY_LENGTH = 4096;

struct RKConfig {
  std::string output_file = DEFAULT_OUTPUT_FILE;
  unsigned key_length = DEFAULT_KEY_LENGTH; // hex digits per key
  std::uint64_t start = DEFAULT_START;      // inclusive
  std::uint64_t end = DEFAULT_END;          // inclusive, >= start
  std::optional<std::uint64_t> num_keys;    // cap; unset = whole range
  bool enable_progress = true;              // allow callbacks
  std::uint64_t progress_stride = 0;        // 0 = auto (~1% of total)
};

struct RKResult {
  std::uint64_t keys_written = 0;
  std::string range_size;   // end - start + 1, decimal (can be 2^64)
  bool clamped = false;     // num_keys was larger than the range
  std::string first_key;    // empty when nothing was written
  std::string last_key;
  std::uint64_t ns_elapsed = 0;
  std::string output_file;  // empty for the stream overload
  std::string engine_info;  // e.g. "rangekeys:0.1.0; gmp:6.3.0"
};

// Progress callback: keys written so far and keys planned in total.
using ProgressCb = std::function<void(std::uint64_t, std::uint64_t)>;

// Throws rk::ConfigError if end < start, or key_length is zero, above
// MAX_KEY_LENGTH or too short for `end`.
void validate(const RKConfig& cfg);

// Write the keys for cfg to cfg.output_file, truncating it.
// Validation happens before the file is touched.
// Throws rk::ConfigError or rk::IoError.
RKResult write_keys(const RKConfig& cfg, ProgressCb cb = {});

// Stream variant; the sink's failure state is reported as rk::IoError.
RKResult write_keys(const RKConfig& cfg, std::ostream& sink, ProgressCb cb = {});

} // namespace rk
