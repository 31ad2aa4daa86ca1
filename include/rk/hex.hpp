// include/rk/hex.hpp
#pragma once
#include <cstdint>
#include <string>

namespace rk {

// Parse a base-16 literal: optional whitespace, '+', "0x" prefix and single
// underscores between digits. Throws rk::ConfigError on anything else,
// including negative values and values wider than 64 bits.
std::uint64_t parse_hex(const std::string& text);

// Number of hex digits needed to write v (hex_digits(0) == 1).
unsigned hex_digits(std::uint64_t v) noexcept;

// Uppercase, left zero-padded to exactly `width` characters.
// Throws std::invalid_argument if v needs more than `width` digits.
std::string format_key(std::uint64_t v, unsigned width);

// Same as format_key but into a caller buffer of at least `width` chars.
// No terminator is written; the caller guarantees hex_digits(v) <= width.
void format_key_into(char* out, std::uint64_t v, unsigned width) noexcept;

// Decimal string of end - start + 1 (exact, 2^64 for the full range).
std::string range_size(std::uint64_t start, std::uint64_t end);

} // namespace rk
