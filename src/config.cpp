// src/config.cpp
#include "rk/config.hpp"
#include "rk/errors.hpp"
#include "rk/hex.hpp"
#include "text.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <istream>
#include <limits>
#include <map>
#include <string>

namespace rk {
namespace {

using detail::trim;

using Section = std::map<std::string, std::string>;

constexpr const char* kDefaultSection = "DEFAULT";

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// Decimal integer with optional sign and single underscores between digits.
// Negative values are rejected since every numeric option is unsigned.
std::uint64_t parse_uint(const std::string& text, std::uint64_t max) {
  const std::string s = trim(text);
  std::size_t i = 0;
  if (!s.empty() && s[0] == '+')
    ++i;
  else if (!s.empty() && s[0] == '-')
    throw ConfigError("'" + text + "' must not be negative");

  std::uint64_t v = 0;
  bool prev_digit = false, any = false;
  for (; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '_' && prev_digit) {
      prev_digit = false;
      continue;
    }
    if (c < '0' || c > '9')
      throw ConfigError("'" + text + "' is not a decimal integer");
    const unsigned d = static_cast<unsigned>(c - '0');
    if (v > (max - d) / 10)
      throw ConfigError("'" + text + "' is out of range (max " +
                        std::to_string(max) + ")");
    v = v * 10 + d;
    prev_digit = any = true;
  }
  if (!any || !prev_digit)
    throw ConfigError("'" + text + "' is not a decimal integer");
  return v;
}

// Minimal INI reader: [section], key = value / key: value, full-line '#' and
// ';' comments, indented continuation lines, lower-cased option names.
std::map<std::string, Section> read_ini(std::istream& in,
                                        const std::string& source) {
  std::map<std::string, Section> sections;
  Section* current = nullptr;
  std::string current_key;
  std::string raw;
  unsigned lineno = 0;

  while (std::getline(in, raw)) {
    ++lineno;
    if (!raw.empty() && raw.back() == '\r')
      raw.pop_back();
    const std::string line = trim(raw);
    const std::string where = source + ":" + std::to_string(lineno);

    if (line.empty() || line[0] == '#' || line[0] == ';') {
      current_key.clear();
      continue;
    }

    if (std::isspace(static_cast<unsigned char>(raw[0])) && current &&
        !current_key.empty()) {
      (*current)[current_key] += "\n" + line;
      continue;
    }

    if (line.front() == '[') {
      if (line.back() != ']' || line.size() < 3)
        throw ConfigError(where + ": malformed section header '" + line + "'");
      const std::string name = trim(line.substr(1, line.size() - 2));
      if (sections.count(name))
        throw ConfigError(where + ": duplicate section [" + name + "]");
      current = &sections[name];
      current_key.clear();
      continue;
    }

    if (!current)
      throw ConfigError(where + ": option outside of any section: '" + line +
                        "'");

    const std::size_t sep = line.find_first_of("=:");
    if (sep == std::string::npos || sep == 0)
      throw ConfigError(where + ": expected 'key = value', got '" + line +
                        "'");
    const std::string key = lower(trim(line.substr(0, sep)));
    if (current->count(key))
      throw ConfigError(where + ": duplicate option '" + key + "'");
    (*current)[key] = trim(line.substr(sep + 1));
    current_key = key;
  }

  if (in.bad())
    throw ConfigError("error while reading configuration " + source);
  return sections;
}

} // namespace

RKConfig parse_config(std::istream& in, const std::string& source) {
  std::map<std::string, Section> sections = read_ini(in, source);

  auto it = sections.find(CONFIG_SECTION);
  if (it == sections.end())
    throw ConfigError(std::string("The '") + CONFIG_SECTION +
                      "' section is missing in the configuration file " +
                      source);

  Section opts;
  auto defaults = sections.find(kDefaultSection);
  if (defaults != sections.end())
    opts = defaults->second;
  for (const auto& kv : it->second)
    opts[kv.first] = kv.second;

  RKConfig cfg;
  std::string current;
  try {
    auto get = [&](const char* name) -> const std::string* {
      current = name;
      auto f = opts.find(name);
      return f == opts.end() ? nullptr : &f->second;
    };

    if (auto v = get("output_file"))
      cfg.output_file = *v;
    if (auto v = get("key_length"))
      cfg.key_length = static_cast<unsigned>(
          parse_uint(*v, std::numeric_limits<unsigned>::max()));
    if (auto v = get("start"))
      cfg.start = parse_hex(*v);
    if (auto v = get("end"))
      cfg.end = parse_hex(*v);
    if (auto v = get("num_keys"))
      cfg.num_keys = parse_uint(*v, std::numeric_limits<std::uint64_t>::max());
  } catch (const ConfigError& e) {
    throw ConfigError("invalid '" + current + "' in " + source +
                      ": " + e.what());
  }

  validate(cfg);
  return cfg;
}

RKConfig load_config(const std::string& path) {
  errno = 0;
  std::ifstream in(path);
  if (!in.is_open()) {
    const int err = errno;
    throw ConfigError("The configuration file '" + path +
                      "' could not be opened" +
                      (err ? std::string(": ") + std::strerror(err) : ""));
  }
  return parse_config(in, "'" + path + "'");
}

} // namespace rk
