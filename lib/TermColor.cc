#include "TermColor.hpp"

#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string_view>
#include <unistd.h>

namespace imgbuild {

static ColorMode parseColorMode(const std::string_view str) noexcept {
  if (str == "always") {
    return ColorMode::Always;
  } else if (str == "auto") {
    return ColorMode::Auto;
  } else if (str == "never") {
    return ColorMode::Never;
  }
  spdlog::warn("unknown color mode `{}`; falling back to auto", str);
  return ColorMode::Auto;
}

class ColorState {
public:
  static ColorState& instance() noexcept {
    static ColorState instance;
    return instance;
  }

  void set(const ColorMode mode) noexcept {
    switch (mode) {
    case ColorMode::Always:
      shouldColor = true;
      break;
    case ColorMode::Auto:
      shouldColor = isatty(STDERR_FILENO) != 0;
      break;
    case ColorMode::Never:
      shouldColor = false;
      break;
    }
    this->mode = mode;
  }

  ColorMode getMode() const noexcept { return mode; }
  bool shouldColorStderr() const noexcept { return shouldColor; }

private:
  ColorMode mode = ColorMode::Auto;
  bool shouldColor = false;

  ColorState() noexcept {
    if (const char* envColor = std::getenv("IMGBUILD_TERM_COLOR")) {
      set(parseColorMode(envColor));
    } else {
      set(ColorMode::Auto);
    }
  }
};

void setColorMode(const std::string_view str) noexcept {
  ColorState::instance().set(parseColorMode(str));
}

ColorMode getColorMode() noexcept { return ColorState::instance().getMode(); }

bool shouldColorStderr() noexcept {
  return ColorState::instance().shouldColorStderr();
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static void testColorModes() {
  setColorMode("always");
  assertTrue(getColorMode() == ColorMode::Always);
  assertTrue(shouldColorStderr());
  assertEq(Red("x"), "\x1b[31mx\x1b[0m");

  setColorMode("never");
  assertTrue(getColorMode() == ColorMode::Never);
  assertFalse(shouldColorStderr());
  assertEq(Bold(Red("x")), "x");

  setColorMode("sometimes");
  assertTrue(getColorMode() == ColorMode::Auto);

  pass();
}

} // namespace tests

int main() { tests::testColorModes(); }

#endif
