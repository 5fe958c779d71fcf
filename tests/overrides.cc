#include "Builder/Builder.hpp"
#include "Builder/DockerCli.hpp"
#include "Manifest.hpp"
#include "ManifestView.hpp"
#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>
#include <utility>

namespace {

constexpr const char* RUNTIME_DOCKERFILE =
    "FROM dotnet/runtime-deps:8.0 AS base\n"
    "RUN echo runtime\n";

constexpr const char* MANIFEST = R"(
[[repos]]
name = "dotnet/runtime-deps"

[[repos.images]]
[[repos.images.platforms]]
dockerfile = "src/runtime-deps/Dockerfile"
tags = ["8.0"]

[[repos]]
name = "dotnet/runtime"

[[repos.images]]
[[repos.images.platforms]]
dockerfile = "src/runtime/Dockerfile"
tags = ["8.0"]
overridden-base-images = ["dotnet/runtime-deps:8.0"]
)";

imgbuild::ManifestView loadView(const tests::TempDir& tmp,
                                const imgbuild::ViewOptions& options = {}) {
  tests::writeFile(tmp / "imgbuild.toml", MANIFEST);
  tests::writeFile(tmp / "src/runtime-deps/Dockerfile", "FROM debian:bookworm\n");
  tests::writeFile(tmp / "src/runtime/Dockerfile", RUNTIME_DOCKERFILE);
  const auto manifest =
      imgbuild::Manifest::tryParse(tmp / "imgbuild.toml", false).unwrap();
  return imgbuild::ManifestView::create(manifest, options).unwrap();
}

rs::Result<imgbuild::BuildSummary> runBuild(const imgbuild::ManifestView& view,
                                            tests::RecordingRunner& runner) {
  tests::CountingPuller puller;
  tests::RecordingIdentity identity;
  const imgbuild::DockerCli docker("docker");
  const imgbuild::CommandExecutor executor(runner, tests::NO_DELAY_RETRY, false);
  imgbuild::BuildOptions options;
  options.skipPulling = true;
  imgbuild::Builder builder(view, std::move(options), executor, docker, puller,
                            identity);
  return builder.run();
}

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "the build reads a private copy with the qualified base image"_test = [] {
    const tests::TempDir tmp;
    imgbuild::ViewOptions options;
    options.registryOverride = "myacr.io";
    const auto view = loadView(tmp, options);

    const tests::fs::path privatePath = tmp / "src/runtime/Dockerfile.temp";
    std::string privateContent;
    tests::RecordingRunner runner;
    runner.onRun = [&](const imgbuild::Command& cmd) {
      if (tests::contains(cmd.toString(), "myacr.io/dotnet/runtime:8.0")) {
        privateContent = tests::readFile(privatePath);
      }
    };

    runBuild(view, runner).unwrap();

    const auto builds = runner.commandsContaining("docker build");
    expect(builds.size() == 2U);
    expect(tests::contains(builds[1], "-f " + privatePath.string()))
        << builds[1];
    expect(privateContent
           == "FROM myacr.io/dotnet/runtime-deps:8.0 AS base\n"
              "RUN echo runtime\n")
        << privateContent;
    expect(!tests::fs::exists(privatePath));
    expect(tests::readFile(tmp / "src/runtime/Dockerfile")
           == RUNTIME_DOCKERFILE);
  };

  "the private copy is removed when the build fails"_test = [] {
    const tests::TempDir tmp;
    const auto view = loadView(tmp);
    const tests::fs::path privatePath = tmp / "src/runtime/Dockerfile.temp";

    bool existedDuringBuild = false;
    tests::RecordingRunner runner("Dockerfile.temp", 100);
    runner.onRun = [&](const imgbuild::Command&) {
      existedDuringBuild = existedDuringBuild || tests::fs::exists(privatePath);
    };

    const auto result = runBuild(view, runner);
    expect(result.is_err());
    expect(existedDuringBuild);
    expect(!tests::fs::exists(privatePath));
    expect(tests::readFile(tmp / "src/runtime/Dockerfile")
           == RUNTIME_DOCKERFILE);
  };

  "the private copy is removed when a hook fails"_test = [] {
    const tests::TempDir tmp;
    const auto view = loadView(tmp);
    const tests::fs::path privatePath = tmp / "src/runtime/Dockerfile.temp";
    tests::writeFile(tmp / "src/runtime/hooks/pre-build", "#!/bin/sh\nexit 1\n");

    bool existedDuringHook = false;
    tests::RecordingRunner runner("pre-build", 1);
    runner.onRun = [&](const imgbuild::Command& cmd) {
      if (tests::contains(cmd.toString(), "pre-build")) {
        existedDuringHook = tests::fs::exists(privatePath);
      }
    };

    const auto result = runBuild(view, runner);
    expect(result.is_err());
    expect(tests::contains(result.unwrap_err()->what(), "pre-build"))
        << result.unwrap_err()->what();
    expect(existedDuringHook);
    expect(!tests::fs::exists(privatePath));
    expect(runner.commandsContaining("Dockerfile.temp").empty());
    expect(tests::readFile(tmp / "src/runtime/Dockerfile")
           == RUNTIME_DOCKERFILE);
  };

  "a repo override changes the qualified name"_test = [] {
    const tests::TempDir tmp;
    imgbuild::ViewOptions options;
    options.repoOverrides.emplace("dotnet/runtime-deps", "mirror/runtime-deps");
    options.filter.repos = { "dotnet/runtime-deps" };
    const auto view = loadView(tmp, options);

    expect(view.filteredImages().size() == 1U);
    expect(view.filteredImages()[0].platforms[0].overriddenBaseImages.empty());
    expect(view.resolveRepoName("dotnet/runtime-deps").unwrap()
           == "mirror/runtime-deps");
  };

  "FROM references of overridden repos are collected"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "imgbuild.toml", R"(
[[repos]]
name = "dotnet/runtime-deps"

[[repos]]
name = "dotnet/runtime"

[[repos.images]]
[[repos.images.platforms]]
dockerfile = "Dockerfile"
tags = ["8.0"]
)");
    tests::writeFile(tmp / "Dockerfile",
                     "FROM dotnet/runtime-deps:8.0 AS base\n"
                     "FROM debian:bookworm\n");
    const auto manifest =
        imgbuild::Manifest::tryParse(tmp / "imgbuild.toml", false).unwrap();
    imgbuild::ViewOptions options;
    options.repoOverrides.emplace("dotnet/runtime-deps", "mirror/runtime-deps");
    const auto view = imgbuild::ManifestView::create(manifest, options).unwrap();

    const auto& platform = view.filteredImages()[0].platforms[0];
    expect(platform.overriddenBaseImages.size() == 1U);
    expect(platform.overriddenBaseImages[0] == "dotnet/runtime-deps:8.0");

    tests::RecordingRunner runner;
    std::string privateContent;
    runner.onRun = [&](const imgbuild::Command&) {
      privateContent = tests::readFile(tmp / "Dockerfile.temp");
    };
    runBuild(view, runner).unwrap();
    expect(privateContent
           == "FROM mirror/runtime-deps:8.0 AS base\n"
              "FROM debian:bookworm\n")
        << privateContent;
  };

  "an override of an undeclared repo is rejected"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "imgbuild.toml", MANIFEST);
    const auto manifest =
        imgbuild::Manifest::tryParse(tmp / "imgbuild.toml", false).unwrap();
    imgbuild::ViewOptions options;
    options.repoOverrides.emplace("dotnet/sdk", "mirror/sdk");

    const auto result = imgbuild::ManifestView::create(manifest, options);
    expect(result.is_err());
    expect(std::string(result.unwrap_err()->what())
           == "unknown repo `dotnet/sdk` in repo override");
  };
}
