// include/rk/config.hpp
#pragma once
#include <iosfwd>
#include <string>
#include "rk.hpp"

namespace rk {

inline constexpr const char* DEFAULT_CONFIG_FILE = "config.ini";
inline constexpr const char* CONFIG_SECTION = "KeyGenerator";

// Read [KeyGenerator] from an INI file. Missing options take the RKConfig
// defaults; the result is validated. Throws rk::ConfigError.
RKConfig load_config(const std::string& path = DEFAULT_CONFIG_FILE);

// Same, from an already open stream. `source` names it in error messages.
RKConfig parse_config(std::istream& in, const std::string& source);

} // namespace rk
