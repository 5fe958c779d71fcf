#pragma once

#include <initializer_list>
#include <string>
#include <string_view>

namespace imgbuild {

inline bool matchesAny(const std::string_view str,
                       const std::initializer_list<std::string_view> candidates) {
  for (const std::string_view candidate : candidates) {
    if (str == candidate) {
      return true;
    }
  }
  return false;
}

inline std::string_view trim(std::string_view str) noexcept {
  constexpr std::string_view whitespace = " \t\r\n\f\v";
  const std::size_t first = str.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const std::size_t last = str.find_last_not_of(whitespace);
  return str.substr(first, last - first + 1);
}

} // namespace imgbuild
