#include "Builder/BaseImages.hpp"

#include "Diag.hpp"
#include "Dockerfile.hpp"
#include "ImageName.hpp"

#include <algorithm>
#include <cctype>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace imgbuild {

static bool equalsIgnoreCase(const std::string_view lhs,
                             const std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, [](const char l, const char r) {
    return std::tolower(static_cast<unsigned char>(l))
           == std::tolower(static_cast<unsigned char>(r));
  });
}

rs::Result<std::vector<BaseImage>>
collectExternalBaseImages(const ManifestView& view) {
  std::vector<BaseImage> baseImages;
  for (const Image& image : view.filteredImages()) {
    for (const Platform& platform : image.platforms) {
      const std::string dockerfile =
          rs_try(readTextFile(platform.dockerfilePath));

      std::unordered_set<std::string> stages;
      for (const FromInstruction& from : parseFromInstructions(dockerfile)) {
        const bool isStage = stages.contains(from.image);
        if (from.stageName.has_value()) {
          stages.insert(from.stageName.value());
        }
        if (isStage || equalsIgnoreCase(from.image, "scratch")
            || from.image.find('$') != std::string::npos
            || view.producesRepo(getRepo(from.image))) {
          spdlog::trace("{}: not pulling `{}`",
                        platform.dockerfileRelPath.generic_string(), from.image);
          continue;
        }

        BaseImage baseImage{ .image = from.image,
                             .platform = platform.platformString() };
        if (std::ranges::find(baseImages, baseImage) == baseImages.end()) {
          baseImages.emplace_back(std::move(baseImage));
        }
      }
    }
  }
  return rs::Ok(std::move(baseImages));
}

rs::Result<void>
DockerBaseImagePuller::pullBaseImages(const ManifestView& view) {
  const std::vector<BaseImage> baseImages =
      rs_try(collectExternalBaseImages(view));
  if (baseImages.empty()) {
    return rs::Ok();
  }

  Diag::heading("PULLING BASE IMAGES");
  for (const BaseImage& baseImage : baseImages) {
    Diag::info("Pulling", "{} ({})", baseImage.image, baseImage.platform);
    rs_try(executor.executeWithRetry(
        docker.makePullCmd(baseImage.image, baseImage.platform)));
  }
  return rs::Ok();
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <fmt/format.h>
#  include <rs/tests.hpp>
#  include <unistd.h>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static fs::path makeDir() {
  const fs::path dir =
      fs::temp_directory_path()
      / fmt::format("imgbuild-base-images-{}", ::getpid());
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static Platform makePlatform(const fs::path& dockerfile,
                             std::string architecture) {
  Platform platform;
  platform.dockerfilePath = dockerfile;
  platform.dockerfileRelPath = dockerfile.filename();
  platform.os = "linux";
  platform.architecture = std::move(architecture);
  return platform;
}

static void testCollect() {
  const fs::path dir = makeDir();
  writeTextFile(dir / "a.Dockerfile",
                "ARG REPO=debian\n"
                "FROM debian:bookworm AS build\n"
                "FROM build AS publish\n"
                "FROM $REPO:bookworm-slim\n"
                "FROM scratch\n"
                "FROM dotnet/runtime-deps:8.0\n"
                "FROM --platform=linux/amd64 mcr.example.com/tools:1\n")
      .unwrap();
  writeTextFile(dir / "b.Dockerfile", "FROM debian:bookworm\n").unwrap();

  Image image;
  image.repoName = "dotnet/runtime";
  image.platforms = { makePlatform(dir / "a.Dockerfile", "amd64"),
                      makePlatform(dir / "b.Dockerfile", "amd64"),
                      makePlatform(dir / "b.Dockerfile", "arm64") };
  const ManifestView view(
      { Repo{ .name = "dotnet/runtime-deps",
              .qualifiedName = "dotnet/runtime-deps" },
        Repo{ .name = "dotnet/runtime", .qualifiedName = "dotnet/runtime" } },
      { image });

  const std::vector<BaseImage> baseImages =
      collectExternalBaseImages(view).unwrap();
  assertEq(baseImages.size(), 3UL);
  assertEq(baseImages[0].image, "debian:bookworm");
  assertEq(baseImages[0].platform, "linux/amd64");
  assertEq(baseImages[1].image, "mcr.example.com/tools:1");
  assertEq(baseImages[2].image, "debian:bookworm");
  assertEq(baseImages[2].platform, "linux/arm64");
  fs::remove_all(dir);

  pass();
}

} // namespace tests

int main() {
  tests::testCollect();
}

#endif
