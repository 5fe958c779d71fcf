#include "ManifestView.hpp"

#include "Dockerfile.hpp"
#include "ImageName.hpp"

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imgbuild {

static std::string normalizeFilterPath(std::string_view path) {
  while (path.starts_with("./")) {
    path.remove_prefix(2);
  }
  return fs::path(path).lexically_normal().generic_string();
}

bool ManifestFilter::matchesRepo(const std::string_view name) const {
  return repos.empty() || std::ranges::find(repos, name) != repos.end();
}

bool ManifestFilter::matchesPlatform(const PlatformDef& platform) const {
  if (osType.has_value() && platform.os != osType.value()) {
    return false;
  }
  if (architecture.has_value()
      && platform.architecture != architecture.value()) {
    return false;
  }
  if (paths.empty()) {
    return true;
  }

  const std::string dockerfile =
      normalizeFilterPath(platform.dockerfile.generic_string());
  return std::ranges::any_of(paths, [&](const std::string& path) {
    return dockerfile.starts_with(normalizeFilterPath(path));
  });
}

static std::string qualifyRepoName(const Manifest& manifest,
                                   const ViewOptions& options,
                                   const std::string& name) {
  if (const auto itr = options.repoOverrides.find(name);
      itr != options.repoOverrides.end()) {
    return itr->second;
  }

  const std::string& prefix =
      options.repoPrefixOverride.value_or(manifest.repoPrefix);
  const std::string registry =
      options.registryOverride.value_or(manifest.registry.value_or(""));
  if (registry.empty()) {
    return prefix + name;
  }
  return fmt::format("{}/{}{}", registry, prefix, name);
}

static std::vector<Tag> qualifyTags(const std::vector<TagDef>& tags,
                                    const std::string& qualifiedRepo) {
  std::vector<Tag> qualified;
  qualified.reserve(tags.size());
  for (const TagDef& tag : tags) {
    qualified.push_back(Tag{ .fullyQualifiedName =
                                 qualifyTag(qualifiedRepo, tag.name),
                             .isLocal = tag.isLocal });
  }
  return qualified;
}

static Platform makePlatform(const fs::path& baseDir, const PlatformDef& def,
                             const std::string& qualifiedRepo) {
  Platform platform;
  platform.dockerfileRelPath = def.dockerfile.lexically_normal();
  platform.dockerfilePath = (baseDir / def.dockerfile).lexically_normal();
  platform.buildContextPath =
      def.context.has_value() ? (baseDir / def.context.value()).lexically_normal()
                              : platform.dockerfilePath.parent_path();
  platform.os = def.os;
  platform.architecture = def.architecture;
  platform.buildArgs = def.buildArgs;
  platform.tags = qualifyTags(def.tags, qualifiedRepo);
  platform.overriddenBaseImages = def.overriddenBaseImages;
  return platform;
}

// Adds the FROM references of `platform` that point at a renamed repo.
static rs::Result<void>
collectRenamedBaseImages(Platform& platform,
                         const std::vector<const Repo*>& renamedRepos) {
  const std::string dockerfile =
      rs_try(readTextFile(platform.dockerfilePath));
  for (const FromInstruction& from : parseFromInstructions(dockerfile)) {
    const std::string repo = getRepo(from.image);
    const bool renamed =
        std::ranges::any_of(renamedRepos, [&](const Repo* candidate) {
          return candidate->name == repo;
        });
    if (!renamed
        || std::ranges::find(platform.overriddenBaseImages, from.image)
               != platform.overriddenBaseImages.end()) {
      continue;
    }
    spdlog::debug("{}: base image `{}` has an overridden repo",
                  platform.dockerfileRelPath.generic_string(), from.image);
    platform.overriddenBaseImages.push_back(from.image);
  }
  return rs::Ok();
}

rs::Result<ManifestView> ManifestView::create(const Manifest& manifest,
                                              const ViewOptions& options) {
  for (const auto& [name, target] : options.repoOverrides) {
    const bool declared =
        std::ranges::any_of(manifest.repos, [&](const RepoDef& repo) {
          return repo.name == name;
        });
    rs_ensure(declared, "unknown repo `{}` in repo override", name);
    rs_ensure(!target.empty(), "repo override for `{}` must not be empty",
              name);
  }

  const fs::path baseDir = manifest.baseDir();
  std::vector<Repo> repos;
  std::vector<Image> images;
  for (const RepoDef& repoDef : manifest.repos) {
    if (!options.filter.matchesRepo(repoDef.name)) {
      continue;
    }

    Repo repo{ .name = repoDef.name,
               .qualifiedName = qualifyRepoName(manifest, options,
                                                repoDef.name) };
    for (const ImageDef& imageDef : repoDef.images) {
      Image image{ .repoName = repo.name,
                   .sharedTags =
                       qualifyTags(imageDef.sharedTags, repo.qualifiedName),
                   .platforms = {} };
      for (const PlatformDef& platformDef : imageDef.platforms) {
        if (options.filter.matchesPlatform(platformDef)) {
          image.platforms.push_back(
              makePlatform(baseDir, platformDef, repo.qualifiedName));
        }
      }
      if (!image.platforms.empty()) {
        images.emplace_back(std::move(image));
      }
    }
    repos.emplace_back(std::move(repo));
  }

  std::vector<const Repo*> renamedRepos;
  for (const Repo& repo : repos) {
    if (repo.name != repo.qualifiedName) {
      renamedRepos.push_back(&repo);
    }
  }
  if (!renamedRepos.empty()) {
    for (Image& image : images) {
      for (Platform& platform : image.platforms) {
        rs_try(collectRenamedBaseImages(platform, renamedRepos));
      }
    }
  }

  return rs::Ok(ManifestView(std::move(repos), std::move(images)));
}

rs::Result<std::string>
ManifestView::resolveRepoName(const std::string_view name) const {
  const auto itr = std::ranges::find(repos, name, &Repo::name);
  rs_ensure(itr != repos.end(), "unknown repo `{}`", name);
  return rs::Ok(itr->qualifiedName);
}

bool ManifestView::producesRepo(const std::string_view repo) const noexcept {
  return std::ranges::any_of(repos, [&](const Repo& candidate) {
    return candidate.name == repo || candidate.qualifiedName == repo;
  });
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static Manifest sampleManifest() {
  return Manifest::tryFromToml(toml::parse_str<toml::ordered_type_config>(R"(
    [[repos]]
    name = "dotnet/runtime-deps"

    [[repos.images]]
    shared-tags = ["8.0"]

    [[repos.images.platforms]]
    dockerfile = "src/runtime-deps/8.0/amd64/Dockerfile"
    tags = ["8.0-amd64"]

    [[repos.images.platforms]]
    dockerfile = "src/runtime-deps/8.0/arm64v8/Dockerfile"
    architecture = "arm64"
    tags = ["8.0-arm64v8"]

    [[repos]]
    name = "dotnet/runtime"

    [[repos.images]]
    shared-tags = [{ name = "8.0", local = true }]

    [[repos.images.platforms]]
    dockerfile = "src/runtime/8.0/amd64/Dockerfile"
    context = "src/runtime"
    os = "windows"
    tags = ["8.0-nanoserver"]
  )"),
                               "/work/imgbuild.toml")
      .unwrap();
}

static void testUnfilteredView() {
  const ManifestView view = ManifestView::create(sampleManifest()).unwrap();

  assertEq(view.filteredRepos().size(), 2UL);
  assertEq(view.filteredImages().size(), 2UL);

  const Image& deps = view.filteredImages()[0];
  assertEq(deps.repoName, "dotnet/runtime-deps");
  assertEq(deps.sharedTags[0].fullyQualifiedName, "dotnet/runtime-deps:8.0");
  assertEq(deps.platforms.size(), 2UL);
  assertEq(deps.platforms[0].dockerfilePath.generic_string(),
           "/work/src/runtime-deps/8.0/amd64/Dockerfile");
  assertEq(deps.platforms[0].buildContextPath.generic_string(),
           "/work/src/runtime-deps/8.0/amd64");
  assertEq(deps.platforms[1].platformString(), "linux/arm64");

  const Image& runtime = view.filteredImages()[1];
  assertTrue(runtime.sharedTags[0].isLocal);
  assertEq(runtime.platforms[0].buildContextPath.generic_string(),
           "/work/src/runtime");

  pass();
}

static void testFilters() {
  {
    ViewOptions options;
    options.filter.architecture = "arm64";
    const auto view = ManifestView::create(sampleManifest(), options).unwrap();
    assertEq(view.filteredImages().size(), 1UL);
    assertEq(view.filteredImages()[0].platforms.size(), 1UL);
    assertEq(view.filteredImages()[0].platforms[0].tags[0].fullyQualifiedName,
             "dotnet/runtime-deps:8.0-arm64v8");
  }
  {
    ViewOptions options;
    options.filter.paths = { "./src/runtime/" };
    const auto view = ManifestView::create(sampleManifest(), options).unwrap();
    assertEq(view.filteredImages().size(), 1UL);
    assertEq(view.filteredImages()[0].repoName, "dotnet/runtime");
    // Filtering images keeps every repo resolvable.
    assertEq(view.filteredRepos().size(), 2UL);
  }
  {
    ViewOptions options;
    options.filter.repos = { "dotnet/runtime" };
    options.filter.osType = "linux";
    const auto view = ManifestView::create(sampleManifest(), options).unwrap();
    assertTrue(view.filteredImages().empty());
    assertEq(view.filteredRepos().size(), 1UL);
  }

  pass();
}

static void testQualifiedNames() {
  ViewOptions options;
  options.registryOverride = "myacr.io";
  options.repoPrefixOverride = "mirror/";
  // Renamed repos make every filtered Dockerfile get scanned; select none.
  options.filter.osType = "freebsd";
  const auto view = ManifestView::create(sampleManifest(), options).unwrap();

  assertTrue(view.filteredImages().empty());
  assertEq(view.resolveRepoName("dotnet/runtime").unwrap(),
           "myacr.io/mirror/dotnet/runtime");
  assertEq(view.resolveRepoName("dotnet/runtime-deps").unwrap(),
           "myacr.io/mirror/dotnet/runtime-deps");
  assertTrue(view.producesRepo("dotnet/runtime"));
  assertTrue(view.producesRepo("myacr.io/mirror/dotnet/runtime"));
  assertFalse(view.producesRepo("debian"));

  pass();
}

static void testUnknownRepos() {
  const ManifestView view = ManifestView::create(sampleManifest()).unwrap();
  assertEq(view.resolveRepoName("dotnet/sdk").unwrap_err()->what(),
           "unknown repo `dotnet/sdk`");

  ViewOptions options;
  options.repoOverrides.emplace("dotnet/sdk", "elsewhere/sdk");
  assertEq(ManifestView::create(sampleManifest(), options)
               .unwrap_err()
               ->what(),
           "unknown repo `dotnet/sdk` in repo override");

  pass();
}

} // namespace tests

int main() {
  tests::testUnfilteredView();
  tests::testFilters();
  tests::testQualifiedNames();
  tests::testUnknownRepos();
}

#endif
