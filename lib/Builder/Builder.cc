#include "Builder/Builder.hpp"

#include "Builder/Tags.hpp"
#include "Diag.hpp"

#include <chrono>
#include <filesystem>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace imgbuild {

Builder::Builder(const ManifestView& view, BuildOptions options,
                 const CommandExecutor& executor, const DockerCli& docker,
                 BaseImagePuller& puller, IdentityScope& identity)
    : view(view), options(std::move(options)), executor(executor),
      docker(docker), puller(puller), identity(identity), overrider(view),
      hooks(executor, this->options.scriptHost) {}

rs::Result<BuildSummary> Builder::run() {
  rs_try(pullBaseImages());

  const auto buildStart = std::chrono::steady_clock::now();
  const std::vector<Tag> builtTags = rs_try(buildImages());
  const std::chrono::duration<double> buildElapsed =
      std::chrono::steady_clock::now() - buildStart;
  if (!builtTags.empty()) {
    Diag::info("Finished", "{} tag{} in {:.2f}s", builtTags.size(),
               builtTags.size() == 1 ? "" : "s", buildElapsed.count());
  }

  std::vector<std::string> pushedTags;
  if (options.push && !builtTags.empty()) {
    pushedTags = rs_try(pushImages(builtTags));
  }

  writeSummary(builtTags);
  return rs::Ok(BuildSummary{ .builtTags = builtTags,
                              .pushedTags = std::move(pushedTags) });
}

rs::Result<void> Builder::pullBaseImages() {
  if (options.skipPulling) {
    spdlog::debug("skipping base image pull");
    return rs::Ok();
  }
  return puller.pullBaseImages(view);
}

rs::Result<std::vector<Tag>> Builder::buildImages() const {
  Diag::heading("BUILDING IMAGES");

  std::vector<Tag> builtTags;
  for (const Image& image : view.filteredImages()) {
    for (const Platform& platform : image.platforms) {
      const std::vector<Tag> tags = rs_try(buildPlatform(image, platform));
      builtTags.insert(builtTags.end(), tags.begin(), tags.end());
    }
  }
  return rs::Ok(std::move(builtTags));
}

rs::Result<std::vector<Tag>>
Builder::buildPlatform(const Image& image, const Platform& platform) const {
  PrivateDockerfile dockerfile = rs_try(overrider.rewrite(platform));
  rs::Result<std::vector<Tag>> built =
      invokeBuild(image, platform, dockerfile.path());
  // A cleanup failure takes precedence over the build result.
  rs_try(dockerfile.release());
  return built;
}

rs::Result<std::vector<Tag>>
Builder::invokeBuild(const Image& image, const Platform& platform,
                     const fs::path& dockerfile) const {
  Diag::info("Building", "{} [{}] ({})", image.repoName,
             platform.platformString(),
             platform.dockerfileRelPath.generic_string());

  rs_try(hooks.invoke(PRE_BUILD_HOOK, platform.buildContextPath));

  const Command buildCmd =
      docker.makeBuildCmd(dockerfile, platform.buildContextPath,
                          resolveTags(image, platform), platform.buildArgs);
  rs_try(executor.execute(buildCmd, options.retry));

  rs_try(hooks.invoke(POST_BUILD_HOOK, platform.buildContextPath));
  // Shared tags label the build only; they are never pushed per platform.
  return rs::Ok(platform.tags);
}

rs::Result<std::vector<std::string>>
Builder::pushImages(const std::vector<Tag>& builtTags) {
  Diag::heading("PUSHING IMAGES");

  std::vector<std::string> pushedTags;
  rs_try(identity.runAs([&]() -> rs::Result<void> {
    for (const Tag& tag : builtTags) {
      if (tag.isLocal) {
        spdlog::debug("not pushing local tag `{}`", tag);
        continue;
      }
      Diag::info("Pushing", "{}", tag);
      rs_try(executor.executeWithRetry(
          docker.makePushCmd(tag.fullyQualifiedName)));
      pushedTags.push_back(tag.fullyQualifiedName);
    }
    return rs::Ok();
  }));
  return rs::Ok(std::move(pushedTags));
}

void Builder::writeSummary(const std::vector<Tag>& builtTags) {
  Diag::heading("IMAGES BUILT");
  if (builtTags.empty()) {
    Diag::message("No images built");
    return;
  }
  for (const Tag& tag : builtTags) {
    Diag::message("{}", tag);
  }
}

} // namespace imgbuild
