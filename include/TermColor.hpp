#pragma once

#include <cstdint>
#include <fmt/color.h>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace imgbuild {

enum class ColorMode : uint8_t {
  Always,
  Auto,
  Never,
};

void setColorMode(std::string_view str) noexcept;
ColorMode getColorMode() noexcept;
bool shouldColorStderr() noexcept;

namespace detail {

template <typename... Args>
inline std::string colorize(const fmt::text_style style,
                            fmt::format_string<Args...> fmt, Args&&... args) {
  if (shouldColorStderr()) {
    return fmt::vformat(style, fmt::string_view(fmt),
                        fmt::make_format_args(args...));
  }
  return fmt::format(fmt, std::forward<Args>(args)...);
}

} // namespace detail

inline std::string Gray(const std::string_view str) {
  return detail::colorize(fmt::fg(fmt::terminal_color::bright_black), "{}",
                          str);
}
inline std::string Red(const std::string_view str) {
  return detail::colorize(fmt::fg(fmt::terminal_color::red), "{}", str);
}
inline std::string Green(const std::string_view str) {
  return detail::colorize(fmt::fg(fmt::terminal_color::green), "{}", str);
}
inline std::string Yellow(const std::string_view str) {
  return detail::colorize(fmt::fg(fmt::terminal_color::yellow), "{}", str);
}
inline std::string Cyan(const std::string_view str) {
  return detail::colorize(fmt::fg(fmt::terminal_color::cyan), "{}", str);
}
inline std::string Bold(const std::string_view str) {
  return detail::colorize(fmt::emphasis::bold, "{}", str);
}

} // namespace imgbuild
