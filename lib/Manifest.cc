#include "Manifest.hpp"

#include "TermColor.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <unordered_set>
#include <utility>
#include <vector>

namespace toml {

template <typename T, typename V, typename... U>
// NOLINTNEXTLINE(readability-identifier-naming,cppcoreguidelines-macro-usage)
inline rs::Result<T> try_find(const V& v, const U&... u) noexcept {
  using std::string_view_literals::operator""sv;

  if (imgbuild::shouldColorStderr()) {
    color::enable();
  } else {
    color::disable();
  }

  try {
    return rs::Ok(toml::find<T>(v, u...));
  } catch (const std::exception& e) {
    std::string what = e.what();

    static constexpr std::string_view errorPrefix = "[error] "sv;
    static constexpr std::string_view colorErrorPrefix =
        "\033[31m\033[01m[error]\033[00m "sv;

    if (what.starts_with(colorErrorPrefix)) {
      what = what.substr(colorErrorPrefix.size());
    } else if (what.starts_with(errorPrefix)) {
      what = what.substr(errorPrefix.size());
    }

    if (!what.empty() && what.back() == '\n') {
      what.pop_back(); // remove the last '\n' since Diag::error adds one.
    }
    return rs::Err(rs::anyhow(what));
  }
}

} // namespace toml

namespace imgbuild {

static rs::Result<TagDef> parseTag(const toml::ordered_value& val) noexcept {
  if (val.is_string()) {
    const std::string& name = val.as_string();
    rs_ensure(!name.empty(), "tag name must not be empty");
    return rs::Ok(TagDef{ .name = name, .isLocal = false });
  }

  rs_ensure(val.is_table(), "tag must be a string or a table");
  std::string name = rs_try(toml::try_find<std::string>(val, "name"));
  rs_ensure(!name.empty(), "tag name must not be empty");
  const bool isLocal = toml::find_or<bool>(val, "local", false);
  return rs::Ok(TagDef{ .name = std::move(name), .isLocal = isLocal });
}

static rs::Result<std::vector<TagDef>> parseTags(const toml::ordered_value& val,
                                                 const char* key) noexcept {
  std::vector<TagDef> tags;
  if (!val.contains(key)) {
    return rs::Ok(tags);
  }

  const auto& tomlTags = val.at(key);
  rs_ensure(tomlTags.is_array(), "`{}` must be an array", key);
  for (const auto& tag : tomlTags.as_array()) {
    tags.emplace_back(rs_try(parseTag(tag)));
  }
  return rs::Ok(tags);
}

static rs::Result<BuildArgs>
parseBuildArgs(const toml::ordered_value& val) noexcept {
  BuildArgs buildArgs;
  if (!val.contains("build-args")) {
    return rs::Ok(buildArgs);
  }

  const auto& tomlArgs = val.at("build-args");
  rs_ensure(tomlArgs.is_table(), "`build-args` must be a table");
  for (const auto& [key, value] : tomlArgs.as_table()) {
    if (value.is_string()) {
      buildArgs.emplace_back(key, value.as_string());
    } else if (value.is_integer()) {
      buildArgs.emplace_back(key, std::to_string(value.as_integer()));
    } else if (value.is_boolean()) {
      buildArgs.emplace_back(key, value.as_boolean() ? "true" : "false");
    } else {
      rs_bail("build argument `{}` must be a string, integer, or boolean",
              key);
    }
  }
  return rs::Ok(buildArgs);
}

static rs::Result<std::vector<std::string>>
parseStringArray(const toml::ordered_value& val, const char* key) noexcept {
  if (!val.contains(key)) {
    return rs::Ok(std::vector<std::string>{});
  }
  return toml::try_find<std::vector<std::string>>(val, key);
}

static rs::Result<PlatformDef>
parsePlatform(const toml::ordered_value& val) noexcept {
  PlatformDef platform;
  platform.dockerfile = rs_try(toml::try_find<std::string>(val, "dockerfile"));
  rs_ensure(!platform.dockerfile.empty(),
            "platform dockerfile must not be empty");
  if (val.contains("context")) {
    platform.context = rs_try(toml::try_find<std::string>(val, "context"));
  }
  platform.os = toml::find_or<std::string>(val, "os", "linux");
  platform.architecture =
      toml::find_or<std::string>(val, "architecture", "amd64");
  platform.buildArgs = rs_try(parseBuildArgs(val));
  platform.tags = rs_try(parseTags(val, "tags"));
  platform.overriddenBaseImages =
      rs_try(parseStringArray(val, "overridden-base-images"));
  return rs::Ok(std::move(platform));
}

static rs::Result<ImageDef> parseImage(const toml::ordered_value& val) noexcept {
  ImageDef image;
  image.sharedTags = rs_try(parseTags(val, "shared-tags"));

  const auto platforms =
      rs_try(toml::try_find<toml::ordered_array>(val, "platforms"));
  rs_ensure(!platforms.empty(), "image must declare at least one platform");
  for (const auto& platform : platforms) {
    image.platforms.emplace_back(rs_try(parsePlatform(platform)));
  }
  return rs::Ok(std::move(image));
}

static rs::Result<RepoDef> parseRepo(const toml::ordered_value& val) noexcept {
  RepoDef repo;
  repo.name = rs_try(toml::try_find<std::string>(val, "name"));
  rs_ensure(!repo.name.empty(), "repo name must not be empty");

  if (!val.contains("images")) {
    spdlog::debug("repo `{}` declares no images", repo.name);
    return rs::Ok(std::move(repo));
  }
  for (const auto& image :
       rs_try(toml::try_find<toml::ordered_array>(val, "images"))) {
    repo.images.emplace_back(rs_try(parseImage(image)));
  }
  return rs::Ok(std::move(repo));
}

static rs::Result<std::vector<RepoDef>>
parseRepos(const toml::ordered_value& data) noexcept {
  std::vector<RepoDef> repos;
  if (!data.contains("repos")) {
    return rs::Ok(repos);
  }

  std::unordered_set<std::string> seen;
  for (const auto& repo :
       rs_try(toml::try_find<toml::ordered_array>(data, "repos"))) {
    RepoDef parsed = rs_try(parseRepo(repo));
    rs_ensure(seen.insert(parsed.name).second, "duplicate repo `{}`",
              parsed.name);
    repos.emplace_back(std::move(parsed));
  }
  return rs::Ok(repos);
}

rs::Result<Manifest> Manifest::tryParse(fs::path path,
                                        const bool findParents) noexcept {
  if (findParents) {
    path = rs_try(findPath(path.parent_path()));
  }

  try {
    return tryFromToml(toml::parse<toml::ordered_type_config>(path), path);
  } catch (const std::exception& e) {
    rs_bail("failed to parse `{}`: {}", path.string(), e.what());
  }
}

rs::Result<Manifest> Manifest::tryFromToml(const toml::ordered_value& data,
                                           fs::path path) noexcept {
  std::optional<std::string> registry;
  if (data.contains("registry")) {
    registry = rs_try(toml::try_find<std::string>(data, "registry"));
  }
  std::string repoPrefix = toml::find_or<std::string>(data, "repo-prefix", "");
  std::vector<RepoDef> repos = rs_try(parseRepos(data));

  return rs::Ok(Manifest(std::move(path), std::move(registry),
                         std::move(repoPrefix), std::move(repos)));
}

// The next directory to search, or nullopt once `dir` is the root.
static std::optional<fs::path> parentSearchDir(const fs::path& dir) {
  if (!dir.has_parent_path()) {
    return std::nullopt;
  }
  fs::path parentPath = dir.parent_path();
  if (parentPath == dir) {
    return std::nullopt;
  }
  return parentPath;
}

rs::Result<fs::path> Manifest::findPath(fs::path candidateDir) noexcept {
  const fs::path origCandDir = candidateDir;
  while (true) {
    const fs::path configPath = candidateDir / FILE_NAME;
    spdlog::trace("Finding manifest: {}", configPath.string());
    if (fs::exists(configPath)) {
      return rs::Ok(configPath);
    }

    const std::optional<fs::path> parentPath = parentSearchDir(candidateDir);
    if (!parentPath.has_value()) {
      break;
    }
    candidateDir = *parentPath;
  }

  rs_bail("{} not found in `{}` and its parents", FILE_NAME,
          origCandDir.string());
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static Manifest parse(const std::string& text) {
  return Manifest::tryFromToml(
             toml::parse_str<toml::ordered_type_config>(text), "imgbuild.toml")
      .unwrap();
}

static std::string parseErr(const std::string& text) {
  return Manifest::tryFromToml(
             toml::parse_str<toml::ordered_type_config>(text), "imgbuild.toml")
      .unwrap_err()
      ->what();
}

static void testEmptyManifest() {
  const Manifest manifest = parse("");
  assertTrue(manifest.repos.empty());
  assertFalse(manifest.registry.has_value());
  assertEq(manifest.repoPrefix, "");

  pass();
}

static void testFullManifest() {
  const Manifest manifest = parse(R"(
    registry = "mcr.example.com"
    repo-prefix = "public/"

    [[repos]]
    name = "dotnet/runtime"

    [[repos.images]]
    shared-tags = ["8.0", { name = "8.0-local", local = true }]

    [[repos.images.platforms]]
    dockerfile = "src/runtime/8.0/amd64/Dockerfile"
    tags = ["8.0-amd64"]
    build-args = { ZETA = "last", ALPHA = "first", RETRIES = 3 }
    overridden-base-images = ["dotnet/runtime-deps:8.0"]

    [[repos.images.platforms]]
    dockerfile = "src/runtime/8.0/arm64v8/Dockerfile"
    context = "src/runtime/8.0"
    architecture = "arm64"
  )");

  assertEq(manifest.registry.value(), "mcr.example.com");
  assertEq(manifest.repoPrefix, "public/");
  assertEq(manifest.repos.size(), 1UL);

  const RepoDef& repo = manifest.repos[0];
  assertEq(repo.name, "dotnet/runtime");
  assertEq(repo.images.size(), 1UL);

  const ImageDef& image = repo.images[0];
  assertEq(image.sharedTags.size(), 2UL);
  assertEq(image.sharedTags[0].name, "8.0");
  assertFalse(image.sharedTags[0].isLocal);
  assertEq(image.sharedTags[1].name, "8.0-local");
  assertTrue(image.sharedTags[1].isLocal);

  assertEq(image.platforms.size(), 2UL);
  const PlatformDef& amd64 = image.platforms[0];
  assertEq(amd64.dockerfile.generic_string(),
           "src/runtime/8.0/amd64/Dockerfile");
  assertFalse(amd64.context.has_value());
  assertEq(amd64.os, "linux");
  assertEq(amd64.architecture, "amd64");
  assertEq(amd64.tags.size(), 1UL);
  assertEq(amd64.overriddenBaseImages.size(), 1UL);

  // Declaration order is kept.
  assertEq(amd64.buildArgs.size(), 3UL);
  assertEq(amd64.buildArgs[0].first, "ZETA");
  assertEq(amd64.buildArgs[1].first, "ALPHA");
  assertEq(amd64.buildArgs[2].first, "RETRIES");
  assertEq(amd64.buildArgs[2].second, "3");

  const PlatformDef& arm64 = image.platforms[1];
  assertEq(arm64.architecture, "arm64");
  assertEq(arm64.context.value().generic_string(), "src/runtime/8.0");
  assertTrue(arm64.tags.empty());
  assertTrue(arm64.buildArgs.empty());

  pass();
}

static void testInvalidManifests() {
  assertEq(parseErr(R"(
    [[repos]]
    name = "a"
    [[repos]]
    name = "a"
  )"),
           "duplicate repo `a`");

  assertEq(parseErr(R"(
    [[repos]]
    name = "a"
    [[repos.images]]
    shared-tags = [""]
    [[repos.images.platforms]]
    dockerfile = "Dockerfile"
  )"),
           "tag name must not be empty");

  assertEq(parseErr(R"(
    [[repos]]
    name = "a"
    [[repos.images]]
    shared-tags = [1]
    [[repos.images.platforms]]
    dockerfile = "Dockerfile"
  )"),
           "tag must be a string or a table");

  assertEq(parseErr(R"(
    [[repos]]
    name = "a"
    [[repos.images]]
    [[repos.images.platforms]]
    dockerfile = "Dockerfile"
    build-args = { X = 1.5 }
  )"),
           "build argument `X` must be a string, integer, or boolean");

  pass();
}

static void testParentSearchDir() {
  assertEq(parentSearchDir("/work/src").value().string(), "/work");
  assertEq(parentSearchDir("/work").value().string(), "/");
  assertFalse(parentSearchDir("/").has_value());
  assertFalse(parentSearchDir("work").has_value());

  pass();
}

} // namespace tests

int main() {
  imgbuild::setColorMode("never");

  tests::testEmptyManifest();
  tests::testFullManifest();
  tests::testInvalidManifests();
  tests::testParentSearchDir();
}

#endif
