#pragma once

#include "ManifestView.hpp"

#include <filesystem>
#include <rs/result.hpp>
#include <string_view>
#include <utility>

namespace imgbuild {

namespace fs = std::filesystem;

inline constexpr std::string_view PRIVATE_DOCKERFILE_SUFFIX = ".temp";

// Owns a rewritten copy of a Dockerfile, or refers to the unmodified source
// when nothing needed rewriting.  Only a rewritten copy is ever deleted.
class PrivateDockerfile {
public:
  // The source Dockerfile itself; nothing to clean up.
  static PrivateDockerfile original(fs::path path) {
    return PrivateDockerfile(std::move(path), false);
  }
  static PrivateDockerfile rewritten(fs::path path) {
    return PrivateDockerfile(std::move(path), true);
  }

  PrivateDockerfile(const PrivateDockerfile&) = delete;
  PrivateDockerfile& operator=(const PrivateDockerfile&) = delete;
  PrivateDockerfile(PrivateDockerfile&& other) noexcept;
  PrivateDockerfile& operator=(PrivateDockerfile&& other) noexcept;
  ~PrivateDockerfile();

  bool didRewrite() const noexcept { return rewrite; }
  const fs::path& path() const noexcept { return filePath; }

  // Deletes the rewritten copy.  Idempotent.
  rs::Result<void> release();

private:
  PrivateDockerfile(fs::path path, const bool rewrite)
      : filePath(std::move(path)), rewrite(rewrite), owned(rewrite) {}

  fs::path filePath;
  bool rewrite;
  bool owned;
};

class DockerfileOverrider {
public:
  explicit DockerfileOverrider(const ManifestView& view) : view(view) {}

  // Substitutes the repository of every overridden base image of `platform`
  // and writes the result next to the source as `<Dockerfile>.temp`.
  rs::Result<PrivateDockerfile> rewrite(const Platform& platform) const;

private:
  const ManifestView& view;
};

} // namespace imgbuild
