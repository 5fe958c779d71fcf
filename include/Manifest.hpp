#pragma once

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <toml.hpp>
#include <utility>
#include <vector>

namespace imgbuild {

namespace fs = std::filesystem;

// Build arguments in declaration order; keys are unique.
using BuildArgs = std::vector<std::pair<std::string, std::string>>;

struct TagDef {
  std::string name;
  bool isLocal = false;

  bool operator==(const TagDef&) const = default;
};

struct PlatformDef {
  fs::path dockerfile; // relative to the manifest directory
  std::optional<fs::path> context;
  std::string os;
  std::string architecture;
  BuildArgs buildArgs;
  std::vector<TagDef> tags;
  std::vector<std::string> overriddenBaseImages;
};

struct ImageDef {
  std::vector<TagDef> sharedTags;
  std::vector<PlatformDef> platforms;
};

struct RepoDef {
  std::string name;
  std::vector<ImageDef> images;
};

class Manifest {
public:
  static constexpr const char* FILE_NAME = "imgbuild.toml";

  const fs::path path;
  const std::optional<std::string> registry;
  const std::string repoPrefix;
  const std::vector<RepoDef> repos;

  static rs::Result<Manifest>
  tryParse(fs::path path = fs::current_path() / FILE_NAME,
           bool findParents = true) noexcept;
  static rs::Result<Manifest> tryFromToml(const toml::ordered_value& data,
                                          fs::path path) noexcept;
  static rs::Result<fs::path>
  findPath(fs::path candidateDir = fs::current_path()) noexcept;

  fs::path baseDir() const { return path.parent_path(); }

private:
  Manifest(fs::path path, std::optional<std::string> registry,
           std::string repoPrefix, std::vector<RepoDef> repos) noexcept
      : path(std::move(path)), registry(std::move(registry)),
        repoPrefix(std::move(repoPrefix)), repos(std::move(repos)) {}
};

} // namespace imgbuild
