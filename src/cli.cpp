// src/cli.cpp
#include "rk/cli.hpp"
#include "rk/config.hpp"
#include "rk/hex.hpp"
#include "rk/rk.hpp"

#include <cstdint>
#include <exception>
#include <ostream>
#include <string>

namespace rk {
namespace {

void print_usage(std::ostream& out, const char* prog) {
  out << "rangekeys " << RK_VERSION
      << " - write every fixed-width hex key in a range to a file\n\n"
      << "Usage: " << prog << " [--config=PATH] [--no-progress]\n\n"
      << "  --config=PATH   INI file with a [" << CONFIG_SECTION
      << "] section (default: " << DEFAULT_CONFIG_FILE << ")\n"
      << "  --no-progress   do not print progress while writing\n"
      << "  --help          show this message\n";
}

} // namespace

int run_cli(int argc, const char* const* argv, std::ostream& out,
            std::ostream& err) {
  // Flags: --config=PATH, --no-progress
  const char* prog = argc > 0 ? argv[0] : "rangekeys";
  std::string config_path = DEFAULT_CONFIG_FILE;
  bool enable_progress = true;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--config=", 0) == 0) {
      config_path = a.substr(9);
    } else if (a == "--no-progress") {
      enable_progress = false;
    } else if (a == "--help" || a == "-h") {
      print_usage(out, prog);
      return EXIT_OK;
    } else {
      err << "Error: unknown argument '" << a << "'\n";
      print_usage(err, prog);
      return EXIT_USAGE;
    }
  }

  try {
    RKConfig cfg = load_config(config_path);
    cfg.enable_progress = enable_progress;

    out << "Total number of keys in range: " << range_size(cfg.start, cfg.end)
        << "\n";
    if (cfg.num_keys)
      out << "Number of keys to generate according to " << config_path << ": "
          << *cfg.num_keys << "\n";

    int last = -1;
    auto progress = [&](std::uint64_t written, std::uint64_t total) {
      if (!total) return;
      int pct = int(written / double(total) * 100);
      if (pct / 5 > last) {  // print at ~5% steps
        out << "  " << written << "/" << total << " (" << pct << "%)\n";
        last = pct / 5;
      }
    };

    auto res = write_keys(cfg, enable_progress ? progress : ProgressCb{});
    if (res.clamped)
      out << "Warning: 'num_keys' (" << *cfg.num_keys
          << ") exceeded the keys available in the range (" << res.range_size
          << "); wrote " << res.keys_written << " keys instead.\n";
    out << "Keys generated and saved in " << res.output_file
        << " | keys=" << res.keys_written;
    if (res.keys_written)
      out << " | " << res.first_key << ".." << res.last_key;
    out << " | ms=" << res.ns_elapsed / 1000000
        << " | engine=" << res.engine_info << "\n";
  } catch (const std::exception& e) { // rk::ConfigError, rk::IoError
    err << "Error: " << e.what() << "\n";
    return EXIT_FAILED;
  }
  return EXIT_OK;
}

} // namespace rk
