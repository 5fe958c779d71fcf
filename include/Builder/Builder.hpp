#pragma once

#include "Builder/BaseImages.hpp"
#include "Builder/BuildHook.hpp"
#include "Builder/CommandExecutor.hpp"
#include "Builder/DockerCli.hpp"
#include "Builder/DockerfileOverrider.hpp"
#include "Builder/IdentityScope.hpp"
#include "ManifestView.hpp"

#include <rs/result.hpp>
#include <string>
#include <vector>

namespace imgbuild {

struct BuildOptions {
  bool skipPulling = false;
  bool push = false;
  bool retry = false;
  ScriptHost scriptHost;
};

struct BuildSummary {
  std::vector<Tag> builtTags;        // build order, duplicates kept
  std::vector<std::string> pushedTags;
};

// Pulls base images, builds every filtered platform, pushes the built tags,
// and reports what was built.
class Builder {
public:
  Builder(const ManifestView& view, BuildOptions options,
          const CommandExecutor& executor, const DockerCli& docker,
          BaseImagePuller& puller, IdentityScope& identity);

  rs::Result<BuildSummary> run();

private:
  const ManifestView& view;
  BuildOptions options;
  const CommandExecutor& executor;
  const DockerCli& docker;
  BaseImagePuller& puller;
  IdentityScope& identity;

  DockerfileOverrider overrider;
  HookInvoker hooks;

  rs::Result<void> pullBaseImages();
  rs::Result<std::vector<Tag>> buildImages() const;
  rs::Result<std::vector<Tag>> buildPlatform(const Image& image,
                                             const Platform& platform) const;
  rs::Result<std::vector<Tag>> invokeBuild(const Image& image,
                                           const Platform& platform,
                                           const fs::path& dockerfile) const;
  rs::Result<std::vector<std::string>>
  pushImages(const std::vector<Tag>& builtTags);
  static void writeSummary(const std::vector<Tag>& builtTags);
};

} // namespace imgbuild
