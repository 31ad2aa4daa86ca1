#include "rk/errors.hpp"
#include "rk/hex.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>

TEST_CASE("format_key pads with zeros and uses uppercase") {
  using rk::format_key;
  REQUIRE(format_key(0x0, 12) == "000000000000");
  REQUIRE(format_key(0xA, 4) == "000A");
  REQUIRE(format_key(0xabcdef, 6) == "ABCDEF");
  REQUIRE(format_key(0xFFFFFFFFFFFFull, 12) == "FFFFFFFFFFFF");
  REQUIRE(format_key(0x1, 20) == "00000000000000000001");
  REQUIRE(format_key(std::numeric_limits<std::uint64_t>::max(), 16) ==
          "FFFFFFFFFFFFFFFF");
}

TEST_CASE("format_key rejects values wider than the key") {
  REQUIRE_THROWS_AS(rk::format_key(0x10, 1), std::invalid_argument);
  REQUIRE_THROWS_AS(rk::format_key(0x1000000000000ull, 12), std::invalid_argument);
  REQUIRE_THROWS_AS(rk::format_key(0x0, 0), std::invalid_argument);
}

TEST_CASE("hex_digits at nibble boundaries") {
  using rk::hex_digits;
  REQUIRE(hex_digits(0x0) == 1);
  REQUIRE(hex_digits(0xF) == 1);
  REQUIRE(hex_digits(0x10) == 2);
  REQUIRE(hex_digits(0xFFFFFFFFFFFFull) == 12);
  REQUIRE(hex_digits(0x1000000000000ull) == 13);
  REQUIRE(hex_digits(std::numeric_limits<std::uint64_t>::max()) == 16);
}

TEST_CASE("parse_hex accepts base-16 literals") {
  using rk::parse_hex;
  REQUIRE(parse_hex("0x0") == 0);
  REQUIRE(parse_hex("0xFFFFFFFFFFFF") == 0xFFFFFFFFFFFFull);
  REQUIRE(parse_hex("0XfF") == 0xFF);
  REQUIRE(parse_hex("ff") == 0xFF);
  REQUIRE(parse_hex("  0x1a  ") == 0x1A);
  REQUIRE(parse_hex("+0x10") == 0x10);
  REQUIRE(parse_hex("0xFFFF_FFFF") == 0xFFFFFFFFull);
  REQUIRE(parse_hex("0x_1") == 0x1);
  REQUIRE(parse_hex("0x0000000000000000000001") == 1);
  REQUIRE(parse_hex("0xFFFFFFFFFFFFFFFF") ==
          std::numeric_limits<std::uint64_t>::max());
}

TEST_CASE("parse_hex rejects malformed literals") {
  using rk::parse_hex;
  for (const char* bad : {"", "   ", "0x", "0xG1", "12 34", "1__2", "_1", "1_",
                          "0x__1", "++1", "0x1.5"}) {
    INFO("input: '" << bad << "'");
    REQUIRE_THROWS_AS(parse_hex(bad), rk::ConfigError);
  }
}

TEST_CASE("parse_hex rejects negative and over-wide values") {
  REQUIRE_THROWS_AS(rk::parse_hex("-0x1"), rk::ConfigError);
  REQUIRE_THROWS_AS(rk::parse_hex("0x10000000000000000"), rk::ConfigError);
}

TEST_CASE("range_size is exact across the whole 64-bit space") {
  using rk::range_size;
  REQUIRE(range_size(0x0, 0x2) == "3");
  REQUIRE(range_size(0xA, 0xA) == "1");
  REQUIRE(range_size(0x0, 0xFFFFFFFFFFFFull) == "281474976710656");
  REQUIRE(range_size(0, std::numeric_limits<std::uint64_t>::max()) ==
          "18446744073709551616");
  REQUIRE(range_size(5, 4) == "0");
}
