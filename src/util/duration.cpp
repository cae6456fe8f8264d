#include "util/duration.hpp"

#include <array>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>

namespace agsq {

namespace {

constexpr std::array<std::pair<char, long long>, 5> kUnits{{
    {'w', 604800},
    {'d', 86400},
    {'h', 3600},
    {'m', 60},
    {'s', 1},
}};

long long unit_seconds(char unit) {
  for (const auto &[suffix, seconds] : kUnits) {
    if (suffix == unit) {
      return seconds;
    }
  }
  throw std::runtime_error("Invalid duration suffix");
}

} // namespace

std::chrono::seconds parse_duration(const std::string &str) {
  if (str.empty()) {
    return std::chrono::seconds{0};
  }

  long long total = 0;
  std::size_t i = 0;
  bool has_unit = false;

  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string");
    }

    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      if (value > (std::numeric_limits<long long>::max() - 9) / 10) {
        throw std::runtime_error("Duration out of range");
      }
      value = value * 10 + (str[i] - '0');
      ++i;
    }

    if (i == str.size()) {
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration");
      }
      total += value;
      break;
    }

    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
    ++i;
    total += value * unit_seconds(unit);
    has_unit = true;
  }

  return std::chrono::seconds{total};
}

std::string format_duration(std::chrono::seconds value) {
  long long remaining = value.count();
  if (remaining <= 0) {
    return std::to_string(remaining) + "s";
  }
  std::string out;
  for (const auto &[suffix, seconds] : kUnits) {
    if (remaining >= seconds) {
      out += std::to_string(remaining / seconds);
      out += suffix;
      remaining %= seconds;
    }
  }
  return out;
}

} // namespace agsq
