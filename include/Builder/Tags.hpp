#pragma once

#include "ManifestView.hpp"

#include <string>
#include <vector>

namespace imgbuild {

// Shared tags of `image` followed by the tags of `platform`, both in
// declaration order.  Duplicates are kept.
std::vector<Tag> resolveTags(const Image& image, const Platform& platform);

// `-t <tag>` for every tag, in order.
std::vector<std::string> makeTagArgs(const std::vector<Tag>& tags);

// `--build-arg <key>=<value>` for every build argument, in order.
std::vector<std::string> makeBuildArgs(const BuildArgs& buildArgs);

} // namespace imgbuild
