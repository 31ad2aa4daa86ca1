// include/rk/cli.hpp
#pragma once
#include <iosfwd>

namespace rk {

// Exit codes of the rangekeys executable.
inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILED = 1; // configuration or I/O error
inline constexpr int EXIT_USAGE = 2;  // unknown command-line argument

// Body of `rangekeys`: parse flags, load the config, write the keys.
// Status goes to `out`, errors to `err` as "Error: <what>".
int run_cli(int argc, const char* const* argv, std::ostream& out,
            std::ostream& err);

} // namespace rk
