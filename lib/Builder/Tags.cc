#include "Builder/Tags.hpp"

#include <fmt/format.h>
#include <string>
#include <vector>

namespace imgbuild {

std::vector<Tag> resolveTags(const Image& image, const Platform& platform) {
  std::vector<Tag> tags;
  tags.reserve(image.sharedTags.size() + platform.tags.size());
  tags.insert(tags.end(), image.sharedTags.begin(), image.sharedTags.end());
  tags.insert(tags.end(), platform.tags.begin(), platform.tags.end());
  return tags;
}

std::vector<std::string> makeTagArgs(const std::vector<Tag>& tags) {
  std::vector<std::string> args;
  args.reserve(tags.size() * 2);
  for (const Tag& tag : tags) {
    args.emplace_back("-t");
    args.push_back(tag.fullyQualifiedName);
  }
  return args;
}

std::vector<std::string> makeBuildArgs(const BuildArgs& buildArgs) {
  std::vector<std::string> args;
  args.reserve(buildArgs.size() * 2);
  for (const auto& [key, value] : buildArgs) {
    args.emplace_back("--build-arg");
    args.push_back(fmt::format("{}={}", key, value));
  }
  return args;
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <fmt/ranges.h>
#  include <rs/tests.hpp>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static Tag tag(std::string name, const bool isLocal = false) {
  return Tag{ .fullyQualifiedName = std::move(name), .isLocal = isLocal };
}

static void testResolveTags() {
  Image image;
  image.sharedTags = { tag("repo:8.0"), tag("repo:latest") };
  Platform platform;
  platform.tags = { tag("repo:8.0-amd64"), tag("repo:8.0", true) };

  const std::vector<Tag> tags = resolveTags(image, platform);
  assertEq(tags.size(), 4UL);
  assertEq(tags[0].fullyQualifiedName, "repo:8.0");
  assertEq(tags[1].fullyQualifiedName, "repo:latest");
  assertEq(tags[2].fullyQualifiedName, "repo:8.0-amd64");
  assertEq(tags[3].fullyQualifiedName, "repo:8.0");
  assertTrue(tags[3].isLocal);

  pass();
}

static void testEmptyTags() {
  const Image image{};
  const Platform platform{};
  assertTrue(resolveTags(image, platform).empty());
  assertTrue(makeTagArgs({}).empty());

  pass();
}

static void testArgs() {
  assertEq(makeTagArgs({ tag("a:1"), tag("b:2") }),
           std::vector<std::string>{ "-t", "a:1", "-t", "b:2" });
  assertEq(makeBuildArgs({ { "VERSION", "8.0.1" }, { "EMPTY", "" } }),
           std::vector<std::string>{ "--build-arg", "VERSION=8.0.1",
                                     "--build-arg", "EMPTY=" });

  pass();
}

} // namespace tests

int main() {
  tests::testResolveTags();
  tests::testEmptyTags();
  tests::testArgs();
}

#endif
