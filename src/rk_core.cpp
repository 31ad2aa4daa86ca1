// src/rk_core.cpp
#include "rk/errors.hpp"
#include "rk/hex.hpp"
#include "rk/rk.hpp"

#include <algorithm> // std::max
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <gmp.h>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

namespace {
inline std::string engine_info() {
  return std::string("rangekeys:") + rk::RK_VERSION + "; gmp:" +
         (::gmp_version ? ::gmp_version : "?");
}

constexpr std::size_t kFileBufferSize = 1u << 20;

// What the loop will do for a validated config.
struct Plan {
  std::uint64_t total = 0; // saturates at UINT64_MAX for the full 2^64 range
  std::uint64_t last = 0;  // last value written, meaningful when total > 0
  bool clamped = false;
};

Plan make_plan(const rk::RKConfig& cfg) {
  constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
  const std::uint64_t span = cfg.end - cfg.start; // keys in range = span + 1

  Plan plan;
  if (!cfg.num_keys) {
    plan.total = (span == kMax) ? kMax : span + 1;
    plan.last = cfg.end;
    return plan;
  }

  const std::uint64_t want = *cfg.num_keys;
  if (span != kMax && want > span + 1) {
    plan.total = span + 1;
    plan.last = cfg.end;
    plan.clamped = true;
  } else {
    plan.total = want;
    plan.last = want ? cfg.start + (want - 1) : cfg.start;
  }
  return plan;
}

inline std::string errno_suffix(int err) {
  return err ? std::string(": ") + std::strerror(err) : std::string();
}

// Core loop. `target` names the sink in error messages.
void stream_keys(const rk::RKConfig& cfg, std::ostream& sink,
                 const rk::ProgressCb& cb, const std::string& target,
                 rk::RKResult& out) {
  const Plan plan = make_plan(cfg);
  out.range_size = rk::range_size(cfg.start, cfg.end);
  out.clamped = plan.clamped;
  out.keys_written = 0;
  if (plan.total == 0)
    return;

  const unsigned width = cfg.key_length;
  const std::uint64_t stride =
      (cfg.progress_stride != 0) ? cfg.progress_stride
                                 : std::max<std::uint64_t>(1, plan.total / 100);
  const bool report = cb && cfg.enable_progress;

  std::vector<char> line(width + 1);
  line[width] = '\n';

  errno = 0;
  for (std::uint64_t v = cfg.start;; ++v) {
    rk::format_key_into(line.data(), v, width);
    sink.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!sink)
      throw rk::IoError("write to " + target + " failed after " +
                        std::to_string(out.keys_written) + " keys" +
                        errno_suffix(errno));
    ++out.keys_written;

    if (report && (out.keys_written % stride == 0 || v == plan.last))
      cb(out.keys_written, plan.total);

    if (v == plan.last)
      break;
  }

  out.first_key = rk::format_key(cfg.start, width);
  out.last_key = rk::format_key(plan.last, width);

  sink.flush();
  if (!sink)
    throw rk::IoError("flush of " + target + " failed" + errno_suffix(errno));
}

} // namespace

namespace rk {

void validate(const RKConfig& cfg) {
  if (cfg.key_length == 0)
    throw ConfigError("key_length must be a positive integer");
  if (cfg.key_length > MAX_KEY_LENGTH)
    throw ConfigError("key_length " + std::to_string(cfg.key_length) +
                      " exceeds the maximum of " +
                      std::to_string(MAX_KEY_LENGTH));
  if (cfg.end < cfg.start)
    throw ConfigError("end (0x" + format_key(cfg.end, hex_digits(cfg.end)) +
                      ") must not be less than start (0x" +
                      format_key(cfg.start, hex_digits(cfg.start)) + ")");
  if (hex_digits(cfg.end) > cfg.key_length)
    throw ConfigError("key_length " + std::to_string(cfg.key_length) +
                      " is too short for end (0x" +
                      format_key(cfg.end, hex_digits(cfg.end)) + " needs " +
                      std::to_string(hex_digits(cfg.end)) + " digits)");
}

RKResult write_keys(const RKConfig& cfg, std::ostream& sink, ProgressCb cb) {
  validate(cfg);

  RKResult out;
  auto t0 = std::chrono::steady_clock::now();
  stream_keys(cfg, sink, cb, "output stream", out);
  auto t1 = std::chrono::steady_clock::now();

  out.ns_elapsed = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
  out.engine_info = engine_info();
  return out;
}

RKResult write_keys(const RKConfig& cfg, ProgressCb cb) {
  validate(cfg);
  if (cfg.output_file.empty())
    throw ConfigError("output_file must not be empty");

  const std::string target = "output file '" + cfg.output_file + "'";

  // Must outlive the stream that buffers into it.
  std::vector<char> buffer(kFileBufferSize);
  std::ofstream file;
  file.rdbuf()->pubsetbuf(buffer.data(),
                          static_cast<std::streamsize>(buffer.size()));

  errno = 0;
  file.open(cfg.output_file,
            std::ios::out | std::ios::trunc | std::ios::binary);
  if (!file.is_open())
    throw IoError("cannot open " + target + errno_suffix(errno));

  RKResult out;
  out.output_file = cfg.output_file;
  auto t0 = std::chrono::steady_clock::now();
  stream_keys(cfg, file, cb, target, out);

  errno = 0;
  file.close();
  if (file.fail())
    throw IoError("cannot close " + target + errno_suffix(errno));
  auto t1 = std::chrono::steady_clock::now();

  out.ns_elapsed = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());
  out.engine_info = engine_info();
  return out;
}

} // namespace rk
