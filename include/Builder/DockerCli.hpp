#pragma once

#include "Command.hpp"
#include "ManifestView.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imgbuild {

namespace fs = std::filesystem;

// Composes container engine command lines.
class DockerCli {
public:
  explicit DockerCli(std::string executable) : executable(std::move(executable)) {}

  // `$IMGBUILD_DOCKER`, falling back to `docker`.
  static DockerCli fromEnv();

  const std::string& getExecutable() const noexcept { return executable; }

  // `build -t <tag>... -f <dockerfile> --build-arg <k>=<v>... <context>`
  Command makeBuildCmd(const fs::path& dockerfile, const fs::path& context,
                       const std::vector<Tag>& tags,
                       const BuildArgs& buildArgs) const;
  Command makePushCmd(std::string_view tag) const;
  // `pull [--platform <platform>] <image>`; an empty platform omits the flag.
  Command makePullCmd(std::string_view image, std::string_view platform) const;

private:
  std::string executable;
};

} // namespace imgbuild
