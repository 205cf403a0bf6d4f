#include "util/duration.hpp"

#include <cctype>
#include <stdexcept>

namespace sgf {

std::chrono::milliseconds parse_duration(const std::string &str) {
  if (str.empty()) {
    return std::chrono::milliseconds{0};
  }

  long long total = 0;
  std::size_t i = 0;
  bool has_unit = false;

  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string: " + str);
    }

    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      ++i;
    }

    if (i == str.size()) {
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration: " + str);
      }
      total += value; // plain milliseconds
      break;
    }

    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
    ++i;
    switch (unit) {
    case 'm':
      if (i < str.size() && std::tolower(static_cast<unsigned char>(str[i])) == 's') {
        ++i;
        total += value;
      } else {
        total += value * 60 * 1000;
      }
      break;
    case 's':
      total += value * 1000;
      break;
    case 'h':
      total += value * 3600 * 1000;
      break;
    case 'd':
      total += value * 86400 * 1000;
      break;
    default:
      throw std::runtime_error("Invalid duration suffix in: " + str);
    }
    has_unit = true;
  }

  return std::chrono::milliseconds{total};
}

} // namespace sgf
