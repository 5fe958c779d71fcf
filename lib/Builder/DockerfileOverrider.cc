#include "Builder/DockerfileOverrider.hpp"

#include "Diag.hpp"
#include "Dockerfile.hpp"
#include "ImageName.hpp"

#include <filesystem>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <utility>

namespace imgbuild {

PrivateDockerfile::PrivateDockerfile(PrivateDockerfile&& other) noexcept
    : filePath(std::move(other.filePath)), rewrite(other.rewrite),
      owned(std::exchange(other.owned, false)) {}

PrivateDockerfile&
PrivateDockerfile::operator=(PrivateDockerfile&& other) noexcept {
  if (this != &other) {
    if (owned) {
      std::error_code ec;
      fs::remove(filePath, ec);
    }
    filePath = std::move(other.filePath);
    rewrite = other.rewrite;
    owned = std::exchange(other.owned, false);
  }
  return *this;
}

PrivateDockerfile::~PrivateDockerfile() {
  if (!owned) {
    return;
  }
  std::error_code ec;
  fs::remove(filePath, ec);
  if (ec) {
    spdlog::warn("failed to remove `{}`: {}", filePath.string(), ec.message());
  }
}

rs::Result<void> PrivateDockerfile::release() {
  if (!owned) {
    return rs::Ok();
  }
  owned = false;

  std::error_code ec;
  fs::remove(filePath, ec);
  rs_ensure(!ec, "failed to remove `{}`: {}", filePath.string(), ec.message());
  spdlog::debug("removed {}", filePath.string());
  return rs::Ok();
}

rs::Result<PrivateDockerfile>
DockerfileOverrider::rewrite(const Platform& platform) const {
  if (platform.overriddenBaseImages.empty()) {
    return rs::Ok(PrivateDockerfile::original(platform.dockerfilePath));
  }

  std::string text = rs_try(readTextFile(platform.dockerfilePath));
  for (const std::string& fromImage : platform.overriddenBaseImages) {
    const std::string repo =
        rs_try(view.resolveRepoName(getRepo(fromImage)));
    const std::string newImage = replaceRepo(fromImage, repo);
    Diag::info("Replacing", "FROM `{}` with `{}`", fromImage, newImage);
    text = rewriteFromReferences(text, fromImage, newImage);
  }

  fs::path privatePath = platform.dockerfilePath;
  privatePath += PRIVATE_DOCKERFILE_SUFFIX;
  Diag::info("Writing", "{}", privatePath.string());
  spdlog::debug("{}:\n{}", privatePath.string(), text);
  rs_try(writeTextFile(privatePath, text));
  return rs::Ok(PrivateDockerfile::rewritten(std::move(privatePath)));
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <fmt/format.h>
#  include <rs/tests.hpp>
#  include <unistd.h>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static fs::path makeDir(const std::string_view name) {
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("imgbuild-override-{}-{}", name, ::getpid());
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static ManifestView makeView() {
  return ManifestView(
      { Repo{ .name = "dotnet/runtime-deps",
              .qualifiedName = "myacr.io/mirror/dotnet/runtime-deps" } },
      {});
}

static void testNoOverrides() {
  const ManifestView view = makeView();
  Platform platform;
  platform.dockerfilePath = "/nonexistent/Dockerfile";

  PrivateDockerfile dockerfile =
      DockerfileOverrider(view).rewrite(platform).unwrap();
  assertFalse(dockerfile.didRewrite());
  assertEq(dockerfile.path().string(), "/nonexistent/Dockerfile");
  assertTrue(dockerfile.release().is_ok());

  pass();
}

static void testRewriteAndRelease() {
  const fs::path dir = makeDir("rewrite");
  const std::string source = "FROM dotnet/runtime-deps:8.0 AS base\n"
                             "RUN echo hi\n";
  writeTextFile(dir / "Dockerfile", source).unwrap();

  const ManifestView view = makeView();
  Platform platform;
  platform.dockerfilePath = dir / "Dockerfile";
  platform.overriddenBaseImages = { "dotnet/runtime-deps:8.0" };

  PrivateDockerfile dockerfile =
      DockerfileOverrider(view).rewrite(platform).unwrap();
  assertTrue(dockerfile.didRewrite());
  assertEq(dockerfile.path(), dir / "Dockerfile.temp");
  assertEq(readTextFile(dockerfile.path()).unwrap(),
           "FROM myacr.io/mirror/dotnet/runtime-deps:8.0 AS base\n"
           "RUN echo hi\n");
  assertEq(readTextFile(dir / "Dockerfile").unwrap(), source);

  assertTrue(dockerfile.release().is_ok());
  assertFalse(fs::exists(dir / "Dockerfile.temp"));
  assertTrue(fs::exists(dir / "Dockerfile"));
  fs::remove_all(dir);

  pass();
}

static void testDestructorRemovesCopy() {
  const fs::path dir = makeDir("dtor");
  writeTextFile(dir / "Dockerfile", "FROM dotnet/runtime-deps:8.0\n").unwrap();

  const ManifestView view = makeView();
  Platform platform;
  platform.dockerfilePath = dir / "Dockerfile";
  platform.overriddenBaseImages = { "dotnet/runtime-deps:8.0" };
  {
    PrivateDockerfile dockerfile =
        DockerfileOverrider(view).rewrite(platform).unwrap();
    PrivateDockerfile moved = std::move(dockerfile);
    assertTrue(fs::exists(moved.path()));
  }
  assertFalse(fs::exists(dir / "Dockerfile.temp"));
  fs::remove_all(dir);

  pass();
}

static void testUnknownRepo() {
  const fs::path dir = makeDir("unknown");
  writeTextFile(dir / "Dockerfile", "FROM dotnet/sdk:8.0\n").unwrap();

  const ManifestView view = makeView();
  Platform platform;
  platform.dockerfilePath = dir / "Dockerfile";
  platform.overriddenBaseImages = { "dotnet/sdk:8.0" };

  const auto result = DockerfileOverrider(view).rewrite(platform);
  assertTrue(result.is_err());
  assertEq(result.unwrap_err()->what(), "unknown repo `dotnet/sdk`");
  assertFalse(fs::exists(dir / "Dockerfile.temp"));
  fs::remove_all(dir);

  pass();
}

} // namespace tests

int main() {
  tests::testNoOverrides();
  tests::testRewriteAndRelease();
  tests::testDestructorRemovesCopy();
  tests::testUnknownRepo();
}

#endif
