// src/hex.cpp
#include "rk/hex.hpp"
#include "rk/errors.hpp"
#include "text.hpp"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <gmp.h>
#include <stdexcept>
#include <string>

namespace rk {
namespace {

using detail::trim;

constexpr char kHexDigits[] = "0123456789ABCDEF";

inline bool is_hex(char c) {
  return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

// mpz_set_ui takes unsigned long, which is 32-bit on some ABIs.
inline void mpz_set_u64(mpz_t x, std::uint64_t v) {
  mpz_import(x, 1, -1, sizeof(v), 0, 0, &v);
}

} // namespace

std::uint64_t parse_hex(const std::string& text) {
  const std::string s = trim(text);
  if (s.empty())
    throw ConfigError("invalid hexadecimal value: empty string");

  std::size_t i = 0;
  if (s[0] == '-')
    throw ConfigError("invalid hexadecimal value '" + text +
                      "': must not be negative");
  if (s[0] == '+')
    ++i;

  // A digit (or the 0x prefix) must precede every underscore.
  bool prev_digit = false;
  if (s.size() - i >= 2 && s[i] == '0' && (s[i + 1] == 'x' || s[i + 1] == 'X')) {
    i += 2;
    prev_digit = true;
  }

  std::string digits;
  digits.reserve(s.size() - i);
  for (; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '_' && prev_digit) {
      prev_digit = false;
    } else if (is_hex(c)) {
      digits.push_back(c);
      prev_digit = true;
    } else {
      throw ConfigError("invalid hexadecimal value '" + text + "'");
    }
  }
  if (digits.empty() || !prev_digit)
    throw ConfigError("invalid hexadecimal value '" + text + "'");

  mpz_t v;
  mpz_init(v);
  if (mpz_set_str(v, digits.c_str(), 16) != 0) {
    mpz_clear(v);
    throw ConfigError("invalid hexadecimal value '" + text + "'");
  }
  if (mpz_sizeinbase(v, 2) > 64) {
    mpz_clear(v);
    throw ConfigError("hexadecimal value '" + text +
                      "' does not fit in 64 bits");
  }

  std::uint64_t out = 0;
  std::size_t words = 0;
  mpz_export(&out, &words, -1, sizeof(out), 0, 0, v); // zero exports nothing
  mpz_clear(v);
  return out;
}

unsigned hex_digits(std::uint64_t v) noexcept {
  unsigned n = 1;
  while (v >>= 4)
    ++n;
  return n;
}

void format_key_into(char* out, std::uint64_t v, unsigned width) noexcept {
  for (unsigned i = width; i-- > 0;) {
    out[i] = kHexDigits[v & 0xF];
    v >>= 4;
  }
}

std::string format_key(std::uint64_t v, unsigned width) {
  if (hex_digits(v) > width)
    throw std::invalid_argument("value does not fit in " +
                                std::to_string(width) + " hex digits");
  std::string out(width, '0');
  format_key_into(&out[0], v, width);
  return out;
}

std::string range_size(std::uint64_t start, std::uint64_t end) {
  if (end < start)
    return "0";

  mpz_t n, lo;
  mpz_init(n);
  mpz_init(lo);
  mpz_set_u64(n, end);
  mpz_set_u64(lo, start);
  mpz_sub(n, n, lo);
  mpz_add_ui(n, n, 1);

  std::string out(mpz_sizeinbase(n, 10) + 2, '\0');
  mpz_get_str(&out[0], 10, n);
  out.resize(std::strlen(out.c_str()));

  mpz_clear(n);
  mpz_clear(lo);
  return out;
}

} // namespace rk
