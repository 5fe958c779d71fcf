#include "Diag.hpp"

#include <cstdio>
#include <fmt/core.h>
#include <string>
#include <string_view>

namespace imgbuild {

static DiagLevel& currentLevel() noexcept {
  static DiagLevel level = DiagLevel::Info;
  return level;
}

void Diag::setLevel(const DiagLevel level) noexcept { currentLevel() = level; }

DiagLevel Diag::getLevel() noexcept { return currentLevel(); }

void Diag::heading(const std::string_view title) {
  if (getLevel() < DiagLevel::Info) {
    return;
  }
  print("");
  print(Bold(title));
  print(std::string(title.size(), '-'));
}

// The header may contain escape sequences, so pad by its visible width.
std::string Diag::alignHeader(std::string colored, const std::size_t width) {
  if (width >= HEADER_WIDTH) {
    return colored;
  }
  return std::string(HEADER_WIDTH - width, ' ') + colored;
}

void Diag::print(const std::string_view line) {
  fmt::print(stderr, "{}\n", line);
  std::fflush(stderr);
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static void testLevelOrdering() {
  Diag::setLevel(DiagLevel::Verbose);
  assertTrue(Diag::isVerbose());
  assertFalse(Diag::isVeryVerbose());
  assertFalse(Diag::isQuiet());

  Diag::setLevel(DiagLevel::Off);
  assertTrue(Diag::isQuiet());
  assertFalse(Diag::isVerbose());

  Diag::setLevel(DiagLevel::Info);

  pass();
}

} // namespace tests

int main() {
  imgbuild::setColorMode("never");

  tests::testLevelOrdering();
}

#endif
