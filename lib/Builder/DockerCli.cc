#include "Builder/DockerCli.hpp"

#include "Builder/Tags.hpp"
#include "Command.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace imgbuild {

DockerCli DockerCli::fromEnv() {
  if (const char* docker = std::getenv("IMGBUILD_DOCKER");
      docker != nullptr && *docker != '\0') {
    return DockerCli(docker);
  }
  return DockerCli("docker");
}

Command DockerCli::makeBuildCmd(const fs::path& dockerfile,
                                const fs::path& context,
                                const std::vector<Tag>& tags,
                                const BuildArgs& buildArgs) const {
  return Command(executable, { "build" })
      .addArgs(makeTagArgs(tags))
      .addArg("-f")
      .addArg(dockerfile.string())
      .addArgs(makeBuildArgs(buildArgs))
      .addArg(context.string());
}

Command DockerCli::makePushCmd(const std::string_view tag) const {
  return Command(executable, { "push" }).addArg(tag);
}

Command DockerCli::makePullCmd(const std::string_view image,
                               const std::string_view platform) const {
  Command cmd(executable, { "pull" });
  if (!platform.empty()) {
    cmd.addArg("--platform").addArg(platform);
  }
  return cmd.addArg(image);
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static void testBuildCmd() {
  const DockerCli docker("docker");
  const Command cmd = docker.makeBuildCmd(
      "/work/src/Dockerfile.temp", "/work/src",
      { Tag{ .fullyQualifiedName = "repo:1", .isLocal = false },
        Tag{ .fullyQualifiedName = "repo:1-amd64", .isLocal = true } },
      { { "VERSION", "1.0" }, { "CHANNEL", "daily" } });

  assertEq(cmd.command, "docker");
  assertEq(cmd.arguments,
           std::vector<std::string>{
               "build", "-t", "repo:1", "-t", "repo:1-amd64", "-f",
               "/work/src/Dockerfile.temp", "--build-arg", "VERSION=1.0",
               "--build-arg", "CHANNEL=daily", "/work/src" });

  pass();
}

static void testBuildCmdWithoutTags() {
  const Command cmd =
      DockerCli("podman").makeBuildCmd("Dockerfile", ".", {}, {});
  assertEq(cmd.toString(), "podman build -f Dockerfile .");

  pass();
}

static void testPushAndPull() {
  const DockerCli docker("docker");
  assertEq(docker.makePushCmd("mcr.example.com/repo:1").toString(),
           "docker push mcr.example.com/repo:1");
  assertEq(docker.makePullCmd("debian:bookworm", "linux/arm64").toString(),
           "docker pull --platform linux/arm64 debian:bookworm");
  assertEq(docker.makePullCmd("debian:bookworm", "").toString(),
           "docker pull debian:bookworm");

  pass();
}

} // namespace tests

int main() {
  tests::testBuildCmd();
  tests::testBuildCmdWithoutTags();
  tests::testPushAndPull();
}

#endif
