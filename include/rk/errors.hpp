// include/rk/errors.hpp
#pragma once
#include <stdexcept>
#include <string>

namespace rk {

// Missing, malformed or inconsistent configuration. Raised before any output.
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Output could not be opened, written, flushed or closed.
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace rk
