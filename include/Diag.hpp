#pragma once

#include "TermColor.hpp"

#include <cstdint>
#include <cstdio>
#include <fmt/core.h>
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <utility>

namespace imgbuild {

enum class DiagLevel : uint8_t {
  Off = 0,  // --quiet
  Error = 1,
  Warn = 2,
  Info = 3, // default
  Verbose = 4,
  VeryVerbose = 5,
};

class Diag {
public:
  static void setLevel(DiagLevel level) noexcept;
  static DiagLevel getLevel() noexcept;

  static bool isVerbose() noexcept {
    return getLevel() >= DiagLevel::Verbose;
  }
  static bool isVeryVerbose() noexcept {
    return getLevel() >= DiagLevel::VeryVerbose;
  }
  static bool isQuiet() noexcept { return getLevel() == DiagLevel::Off; }

  template <typename... Args>
  static void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() < DiagLevel::Error) {
      return;
    }
    print(fmt::format("{} {}", Bold(Red("Error:")),
                      fmt::format(fmt, std::forward<Args>(args)...)));
  }

  template <typename... Args>
  static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() < DiagLevel::Warn) {
      return;
    }
    print(fmt::format("{} {}", Bold(Yellow("Warning:")),
                      fmt::format(fmt, std::forward<Args>(args)...)));
  }

  // Cargo-style status line: a right-aligned colored header and a message.
  template <typename... Args>
  static void info(const std::string_view header,
                   fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() < DiagLevel::Info) {
      return;
    }
    print(fmt::format("{} {}", alignHeader(Bold(Green(header)), header.size()),
                      fmt::format(fmt, std::forward<Args>(args)...)));
  }

  // Phase heading followed by an underline of the same width.
  static void heading(std::string_view title);

  // Plain line, printed unless --quiet.
  template <typename... Args>
  static void message(fmt::format_string<Args...> fmt, Args&&... args) {
    if (getLevel() < DiagLevel::Info) {
      return;
    }
    print(fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  static constexpr std::size_t HEADER_WIDTH = 12;

  static std::string alignHeader(std::string colored, std::size_t width);
  static void print(std::string_view line);
};

} // namespace imgbuild
