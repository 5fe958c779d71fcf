#pragma once

#include "Builder/CommandExecutor.hpp"
#include "Builder/DockerCli.hpp"
#include "ManifestView.hpp"

#include <rs/result.hpp>
#include <string>
#include <vector>

namespace imgbuild {

struct BaseImage {
  std::string image;
  std::string platform; // `<os>/<architecture>`

  bool operator==(const BaseImage&) const = default;
};

// External images named by the `FROM` instructions of the filtered
// platforms, in first-seen order without duplicates.  `scratch`, build stage
// names, references to build arguments, and images this manifest produces
// are skipped.
rs::Result<std::vector<BaseImage>>
collectExternalBaseImages(const ManifestView& view);

class BaseImagePuller {
public:
  virtual ~BaseImagePuller() = default;
  virtual rs::Result<void> pullBaseImages(const ManifestView& view) = 0;
};

class DockerBaseImagePuller final : public BaseImagePuller {
public:
  DockerBaseImagePuller(const CommandExecutor& executor, const DockerCli& docker)
      : executor(executor), docker(docker) {}

  rs::Result<void> pullBaseImages(const ManifestView& view) override;

private:
  const CommandExecutor& executor;
  const DockerCli& docker;
};

} // namespace imgbuild
