#include "Builder/Builder.hpp"
#include "Builder/DockerCli.hpp"
#include "Manifest.hpp"
#include "ManifestView.hpp"
#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>
#include <utility>
#include <vector>

namespace {

imgbuild::ManifestView loadView(const tests::TempDir& tmp,
                                const std::string& manifest,
                                const imgbuild::ViewOptions& options = {}) {
  tests::writeFile(tmp / "imgbuild.toml", manifest);
  const auto parsed =
      imgbuild::Manifest::tryParse(tmp / "imgbuild.toml", false).unwrap();
  return imgbuild::ManifestView::create(parsed, options).unwrap();
}

struct Harness {
  tests::RecordingRunner runner;
  tests::CountingPuller puller;
  tests::RecordingIdentity identity;
  imgbuild::DockerCli docker{ "docker" };

  rs::Result<imgbuild::BuildSummary> run(const imgbuild::ManifestView& view,
                                         imgbuild::BuildOptions options = {},
                                         const bool isDryRun = false) {
    const imgbuild::CommandExecutor executor(runner, tests::NO_DELAY_RETRY,
                                             isDryRun);
    imgbuild::Builder builder(view, std::move(options), executor, docker,
                              puller, identity);
    return builder.run();
  }
};

std::vector<std::string> names(const std::vector<imgbuild::Tag>& tags) {
  std::vector<std::string> names;
  for (const imgbuild::Tag& tag : tags) {
    names.push_back(tag.fullyQualifiedName);
  }
  return names;
}

constexpr const char* SINGLE_IMAGE = R"(
[[repos]]
name = "dotnet/runtime"

[[repos.images]]
shared-tags = ["8.0", "latest"]

[[repos.images.platforms]]
dockerfile = "src/runtime/Dockerfile"
tags = ["8.0-amd64", { name = "8.0-dev", local = true }]
build-args = { VERSION = "8.0.1" }
)";

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "shared tags precede platform tags"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/runtime/Dockerfile", "FROM debian:bookworm\n");
    const auto view = loadView(tmp, SINGLE_IMAGE);

    Harness harness;
    const auto summary = harness.run(view).unwrap();

    const auto builds = harness.runner.commandsContaining("docker build");
    expect(builds.size() == 1U);
    expect(tests::contains(
        builds.front(),
        "docker build -t dotnet/runtime:8.0 -t dotnet/runtime:latest "
        "-t dotnet/runtime:8.0-amd64 -t dotnet/runtime:8.0-dev -f "))
        << builds.front();
    expect(tests::contains(builds.front(), "--build-arg VERSION=8.0.1"));
    expect(names(summary.builtTags)
           == std::vector<std::string>{ "dotnet/runtime:8.0-amd64",
                                        "dotnet/runtime:8.0-dev" });
    expect(harness.puller.calls == 1U);
  };

  "local tags are never pushed"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/runtime/Dockerfile", "FROM debian:bookworm\n");
    const auto view = loadView(tmp, SINGLE_IMAGE);

    Harness harness;
    imgbuild::BuildOptions options;
    options.push = true;
    const auto summary = harness.run(view, options).unwrap();

    expect(harness.runner.commandsContaining("docker push")
           == std::vector<std::string>{
               "docker push dotnet/runtime:8.0-amd64" });
    expect(summary.pushedTags.size() == 1U);
    expect(harness.identity.entered == 1U);
  };

  "shared tags are not pushed per platform"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "amd64/Dockerfile", "FROM debian:bookworm\n");
    tests::writeFile(tmp / "arm64/Dockerfile", "FROM debian:bookworm\n");
    const auto view = loadView(tmp, R"(
[[repos]]
name = "repo"

[[repos.images]]
shared-tags = ["8.0"]

[[repos.images.platforms]]
dockerfile = "amd64/Dockerfile"
tags = ["amd64"]

[[repos.images.platforms]]
dockerfile = "arm64/Dockerfile"
architecture = "arm64"
tags = ["arm64"]
)");

    Harness harness;
    imgbuild::BuildOptions options;
    options.push = true;
    const auto summary = harness.run(view, options).unwrap();

    const auto builds = harness.runner.commandsContaining("docker build");
    expect(builds.size() == 2U);
    for (const std::string& build : builds) {
      expect(tests::contains(build, "-t repo:8.0 ")) << build;
    }
    expect(names(summary.builtTags)
           == std::vector<std::string>{ "repo:amd64", "repo:arm64" });
    expect(harness.runner.commandsContaining("docker push")
           == std::vector<std::string>{ "docker push repo:amd64",
                                        "docker push repo:arm64" });
  };

  "nothing is pushed without --push"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/runtime/Dockerfile", "FROM debian:bookworm\n");
    const auto view = loadView(tmp, SINGLE_IMAGE);

    Harness harness;
    const auto summary = harness.run(view).unwrap();
    expect(harness.runner.commandsContaining("docker push").empty());
    expect(summary.pushedTags.empty());
    expect(harness.identity.entered == 0U);
  };

  "an empty filtered manifest builds and pushes nothing"_test = [] {
    const tests::TempDir tmp;
    imgbuild::ViewOptions options;
    options.filter.osType = "windows";
    const auto view = loadView(tmp, SINGLE_IMAGE, options);

    Harness harness;
    imgbuild::BuildOptions buildOptions;
    buildOptions.push = true;
    buildOptions.skipPulling = true;
    const auto summary = harness.run(view, buildOptions).unwrap();

    expect(summary.builtTags.empty());
    expect(summary.pushedTags.empty());
    expect(harness.runner.invocations.empty());
    expect(harness.identity.entered == 0U);
    expect(harness.puller.calls == 0U);
  };

  "dry run spawns no processes"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/runtime/Dockerfile", "FROM debian:bookworm\n");
    const auto view = loadView(tmp, SINGLE_IMAGE);

    Harness harness;
    imgbuild::BuildOptions options;
    options.push = true;
    const auto summary = harness.run(view, options, true).unwrap();

    expect(harness.runner.invocations.empty());
    expect(summary.builtTags.size() == 2U);
  };

  "a failed build is retried only with --retry"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "src/runtime/Dockerfile", "FROM debian:bookworm\n");
    const auto view = loadView(tmp, SINGLE_IMAGE);

    {
      Harness harness{ .runner = tests::RecordingRunner("docker build", 1) };
      const auto result = harness.run(view);
      expect(result.is_err());
      expect(harness.runner.commandsContaining("docker build").size() == 1U);
    }
    {
      Harness harness{ .runner = tests::RecordingRunner("docker build", 2) };
      imgbuild::BuildOptions options;
      options.retry = true;
      const auto summary = harness.run(view, options).unwrap();
      expect(harness.runner.commandsContaining("docker build").size() == 3U);
      expect(summary.builtTags.size() == 2U);
    }
    {
      Harness harness{ .runner = tests::RecordingRunner("docker build", 10) };
      imgbuild::BuildOptions options;
      options.retry = true;
      const auto result = harness.run(view, options);
      expect(result.is_err());
      expect(harness.runner.commandsContaining("docker build").size() == 3U);
    }
  };

  "platforms are built in manifest order"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "a/Dockerfile", "FROM debian:bookworm\n");
    tests::writeFile(tmp / "b/Dockerfile", "FROM debian:bookworm\n");
    tests::writeFile(tmp / "c/Dockerfile", "FROM debian:bookworm\n");
    const auto view = loadView(tmp, R"(
[[repos]]
name = "first"

[[repos.images]]
[[repos.images.platforms]]
dockerfile = "a/Dockerfile"
tags = ["a"]

[[repos.images.platforms]]
dockerfile = "b/Dockerfile"
architecture = "arm64"
tags = ["b"]

[[repos]]
name = "second"

[[repos.images]]
[[repos.images.platforms]]
dockerfile = "c/Dockerfile"
tags = ["c"]
)");

    Harness harness;
    const auto summary = harness.run(view).unwrap();
    expect(names(summary.builtTags)
           == std::vector<std::string>{ "first:a", "first:b", "second:c" });
  };
}
