#include "ImageName.hpp"

#include <fmt/format.h>
#include <string>
#include <string_view>

namespace imgbuild {

// Index where the tag/digest suffix starts, or the size of the reference.
static std::size_t suffixPos(const std::string_view imageRef) noexcept {
  std::string_view name = imageRef;
  if (const std::size_t at = name.find('@'); at != std::string_view::npos) {
    name = name.substr(0, at);
  }

  // A colon before the last slash belongs to a registry port.
  const std::size_t lastSlash = name.rfind('/');
  const std::size_t colon = name.rfind(':');
  if (colon != std::string_view::npos
      && (lastSlash == std::string_view::npos || colon > lastSlash)) {
    return colon;
  }
  return name.size();
}

std::string getRepo(const std::string_view imageRef) {
  return std::string(imageRef.substr(0, suffixPos(imageRef)));
}

std::string getTagSuffix(const std::string_view imageRef) {
  return std::string(imageRef.substr(suffixPos(imageRef)));
}

std::string replaceRepo(const std::string_view imageRef,
                        const std::string_view newRepo) {
  return fmt::format("{}{}", newRepo, getTagSuffix(imageRef));
}

std::string qualifyTag(const std::string_view repo, const std::string_view tag) {
  return fmt::format("{}:{}", repo, tag);
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static void testGetRepo() {
  assertEq(getRepo("dotnet/runtime:8.0"), "dotnet/runtime");
  assertEq(getRepo("dotnet/runtime"), "dotnet/runtime");
  assertEq(getRepo("localhost:5000/dotnet/runtime:8.0"),
           "localhost:5000/dotnet/runtime");
  assertEq(getRepo("localhost:5000/dotnet/runtime"),
           "localhost:5000/dotnet/runtime");
  assertEq(getRepo("debian@sha256:abcd"), "debian");
  assertEq(getRepo("debian:bookworm@sha256:abcd"), "debian");

  pass();
}

static void testGetTagSuffix() {
  assertEq(getTagSuffix("dotnet/runtime:8.0"), ":8.0");
  assertEq(getTagSuffix("dotnet/runtime"), "");
  assertEq(getTagSuffix("debian@sha256:abcd"), "@sha256:abcd");
  assertEq(getTagSuffix("debian:bookworm@sha256:abcd"),
           ":bookworm@sha256:abcd");

  pass();
}

static void testReplaceRepo() {
  assertEq(replaceRepo("repoA:tag1", "repoB"), "repoB:tag1");
  assertEq(replaceRepo("dotnet/runtime-deps:8.0-bookworm-slim",
                       "myacr.io/public/dotnet/runtime-deps"),
           "myacr.io/public/dotnet/runtime-deps:8.0-bookworm-slim");
  assertEq(replaceRepo("localhost:5000/base@sha256:00ff", "other/base"),
           "other/base@sha256:00ff");
  assertEq(replaceRepo("untagged", "renamed"), "renamed");

  pass();
}

static void testQualifyTag() {
  assertEq(qualifyTag("dotnet/runtime", "8.0"), "dotnet/runtime:8.0");

  pass();
}

} // namespace tests

int main() {
  tests::testGetRepo();
  tests::testGetTagSuffix();
  tests::testReplaceRepo();
  tests::testQualifyTag();
}

#endif
