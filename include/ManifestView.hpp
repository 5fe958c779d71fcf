#pragma once

#include "Manifest.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imgbuild {

namespace fs = std::filesystem;

struct Tag {
  std::string fullyQualifiedName;
  bool isLocal = false;

  bool operator==(const Tag&) const = default;
};

struct Platform {
  fs::path dockerfilePath;      // absolute
  fs::path dockerfileRelPath;   // relative to the manifest directory
  fs::path buildContextPath;    // absolute
  std::string os;
  std::string architecture;
  BuildArgs buildArgs;
  std::vector<Tag> tags;
  std::vector<std::string> overriddenBaseImages;

  // `<os>/<architecture>`, as accepted by `docker pull --platform`.
  std::string platformString() const {
    return fmt::format("{}/{}", os, architecture);
  }
};

struct Image {
  std::string repoName;
  std::vector<Tag> sharedTags;
  std::vector<Platform> platforms;
};

struct Repo {
  std::string name;          // as declared in the manifest
  std::string qualifiedName; // used for tags and FROM rewrites
};

struct ManifestFilter {
  std::vector<std::string> paths; // Dockerfile path prefixes
  std::optional<std::string> osType;
  std::optional<std::string> architecture;
  std::vector<std::string> repos;

  bool matchesRepo(std::string_view name) const;
  bool matchesPlatform(const PlatformDef& platform) const;
};

struct ViewOptions {
  ManifestFilter filter;
  std::map<std::string, std::string> repoOverrides; // declared -> target
  std::optional<std::string> registryOverride;
  std::optional<std::string> repoPrefixOverride;
};

// Read-only, filtered view of a manifest.
class ManifestView {
public:
  ManifestView(std::vector<Repo> repos, std::vector<Image> images)
      : repos(std::move(repos)), images(std::move(images)) {}

  static rs::Result<ManifestView> create(const Manifest& manifest,
                                         const ViewOptions& options = {});

  const std::vector<Image>& filteredImages() const noexcept { return images; }
  const std::vector<Repo>& filteredRepos() const noexcept { return repos; }

  // Qualified name of the repo declared as `name`.
  rs::Result<std::string> resolveRepoName(std::string_view name) const;

  // Whether `repo` names an image this manifest produces.
  bool producesRepo(std::string_view repo) const noexcept;

private:
  std::vector<Repo> repos;
  std::vector<Image> images;
};

} // namespace imgbuild

template <>
struct fmt::formatter<imgbuild::Tag> : formatter<std::string_view> {
  auto format(const imgbuild::Tag& tag, format_context& ctx) const
      -> format_context::iterator {
    return formatter<std::string_view>::format(tag.fullyQualifiedName, ctx);
  }
};
