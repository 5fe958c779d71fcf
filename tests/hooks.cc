#include "Builder/Builder.hpp"
#include "Builder/BuildHook.hpp"
#include "Builder/DockerCli.hpp"
#include "Manifest.hpp"
#include "ManifestView.hpp"
#include "helpers.hpp"

#include <boost/ut.hpp>
#include <string>
#include <utility>

namespace {

constexpr const char* MANIFEST = R"(
[[repos]]
name = "app"

[[repos.images]]
[[repos.images.platforms]]
dockerfile = "app/Dockerfile"
tags = ["1"]
)";

const imgbuild::ScriptHost TEST_HOST{ .interpreter = "pwsh",
                                      .extension = ".ps1" };

imgbuild::ManifestView loadView(const tests::TempDir& tmp) {
  tests::writeFile(tmp / "imgbuild.toml", MANIFEST);
  tests::writeFile(tmp / "app/Dockerfile", "FROM debian:bookworm\n");
  const auto manifest =
      imgbuild::Manifest::tryParse(tmp / "imgbuild.toml", false).unwrap();
  return imgbuild::ManifestView::create(manifest).unwrap();
}

rs::Result<imgbuild::BuildSummary> runBuild(const imgbuild::ManifestView& view,
                                            tests::RecordingRunner& runner) {
  tests::CountingPuller puller;
  tests::RecordingIdentity identity;
  const imgbuild::DockerCli docker("docker");
  const imgbuild::CommandExecutor executor(runner, tests::NO_DELAY_RETRY, false);
  imgbuild::BuildOptions options;
  options.skipPulling = true;
  options.scriptHost = TEST_HOST;
  imgbuild::Builder builder(view, std::move(options), executor, docker, puller,
                            identity);
  return builder.run();
}

} // namespace

int main() {
  using boost::ut::expect;
  using boost::ut::operator""_test;

  "hooks run around the build in the build context"_test = [] {
    const tests::TempDir tmp;
    const auto view = loadView(tmp);
    const tests::fs::path context = tmp / "app";
    tests::writeFile(context / "hooks/pre-build", "#!/bin/sh\n");
    tests::writeFile(context / "hooks/post-build.ps1", "Write-Host done\n");

    tests::RecordingRunner runner;
    runBuild(view, runner).unwrap();

    expect(runner.invocations.size() == 3U);
    expect(runner.invocations[0].command
           == (context / "hooks/pre-build").string())
        << runner.invocations[0].command;
    expect(runner.invocations[0].workingDirectory == context);
    expect(tests::contains(runner.invocations[1].command, "docker build"));
    expect(runner.invocations[2].command
           == "pwsh -NoProfile -File "
                  + (context / "hooks/post-build.ps1").string())
        << runner.invocations[2].command;
    expect(runner.invocations[2].workingDirectory == context);
  };

  "a build without hooks runs only docker"_test = [] {
    const tests::TempDir tmp;
    const auto view = loadView(tmp);
    tests::fs::create_directories(tmp / "app/hooks");

    tests::RecordingRunner runner;
    runBuild(view, runner).unwrap();
    expect(runner.invocations.size() == 1U);
  };

  "a failing hook aborts the build"_test = [] {
    const tests::TempDir tmp;
    const auto view = loadView(tmp);
    const tests::fs::path hook = tmp / "app/hooks/pre-build";
    tests::writeFile(hook, "#!/bin/sh\nexit 1\n");

    tests::RecordingRunner runner("pre-build", 1);
    const auto result = runBuild(view, runner);
    expect(result.is_err());
    expect(tests::contains(
        result.unwrap_err()->what(),
        "failed to execute build hook '" + hook.string() + "'"))
        << result.unwrap_err()->what();
    expect(runner.commandsContaining("docker build").empty());
  };

  "a custom script host runs interpreted hooks"_test = [] {
    const tests::TempDir tmp;
    tests::writeFile(tmp / "hooks/pre-build.ps1", "");
    const auto hook =
        imgbuild::findBuildHook(imgbuild::PRE_BUILD_HOOK, tmp.path,
                                imgbuild::ScriptHost{ .interpreter = "my-pwsh",
                                                      .extension = ".ps1" });
    expect(hook != nullptr);
    expect(hook->makeCommand().command == "my-pwsh");
  };
}
