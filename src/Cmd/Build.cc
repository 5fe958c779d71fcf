#include "Build.hpp"

#include "Algos.hpp"
#include "Builder/BaseImages.hpp"
#include "Builder/BuildHook.hpp"
#include "Builder/Builder.hpp"
#include "Builder/CommandExecutor.hpp"
#include "Builder/DockerCli.hpp"
#include "Builder/IdentityScope.hpp"
#include "Cli.hpp"
#include "Command.hpp"
#include "Diag.hpp"
#include "Manifest.hpp"
#include "ManifestView.hpp"

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <system_error>

namespace imgbuild {

static rs::Result<void> buildMain(CliArgsView args);

const Subcmd BUILD_CMD =
    Subcmd{ "build" }
        .setShort("b")
        .setDesc("Build the images described by the manifest")
        .addOpt(Opt{ "--manifest" }
                    .setDesc("Path to the manifest file")
                    .setPlaceholder("<PATH>"))
        .addOpt(Opt{ "--path" }
                    .setDesc("Only build Dockerfiles under this path prefix")
                    .setPlaceholder("<PREFIX>"))
        .addOpt(Opt{ "--os-type" }
                    .setDesc("Only build platforms of this OS")
                    .setPlaceholder("<OS>"))
        .addOpt(Opt{ "--architecture" }
                    .setDesc("Only build platforms of this architecture")
                    .setPlaceholder("<ARCH>"))
        .addOpt(Opt{ "--repo" }
                    .setDesc("Only build images of this repo")
                    .setPlaceholder("<NAME>"))
        .addOpt(Opt{ "--repo-override" }
                    .setDesc("Use another repository name for a repo")
                    .setPlaceholder("<NAME>=<TARGET>"))
        .addOpt(Opt{ "--registry" }
                    .setDesc("Registry of the built images")
                    .setPlaceholder("<HOST>"))
        .addOpt(Opt{ "--repo-prefix" }
                    .setDesc("Prefix prepended to every repo name")
                    .setPlaceholder("<PREFIX>"))
        .addOpt(Opt{ "--push" }.setDesc("Push the built images"))
        .addOpt(Opt{ "--skip-pulling" }.setDesc("Do not pull base images"))
        .addOpt(Opt{ "--retry" }.setDesc("Retry failed docker builds"))
        .addOpt(Opt{ "--retry-attempts" }
                    .setDesc("Attempts per retried command")
                    .setPlaceholder("<N>")
                    .setDefault("5"))
        .addOpt(Opt{ "--retry-delay-ms" }
                    .setDesc("Delay factor between retries")
                    .setPlaceholder("<MS>")
                    .setDefault("5000"))
        .addOpt(Opt{ "--dry-run" }.setDesc(
            "Print the docker commands without running them"))
        .setMainFn(buildMain);

static rs::Result<std::uint64_t> parseCount(const std::string_view opt,
                                            const std::string_view value) {
  std::uint64_t count{};
  const auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), count);
  rs_ensure(ec == std::errc() && ptr == value.data() + value.size(),
            "invalid value for `{}`: {}", opt, value);
  return rs::Ok(count);
}

static rs::Result<void> addRepoOverride(ViewOptions& viewOptions,
                                        const std::string_view value) {
  const std::size_t eq = value.find('=');
  rs_ensure(eq != std::string_view::npos && eq != 0,
            "invalid repo override `{}`: expected <NAME>=<TARGET>", value);
  viewOptions.repoOverrides.insert_or_assign(std::string(value.substr(0, eq)),
                                             std::string(value.substr(eq + 1)));
  return rs::Ok();
}

static rs::Result<void> buildMain(const CliArgsView args) {
  // Parse args
  std::optional<std::filesystem::path> manifestPath;
  ViewOptions viewOptions;
  BuildOptions buildOptions;
  RetryPolicy retryPolicy;
  bool isDryRun = false;
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end(), "build"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "--push") {
      buildOptions.push = true;
    } else if (arg == "--skip-pulling") {
      buildOptions.skipPulling = true;
    } else if (arg == "--retry") {
      buildOptions.retry = true;
    } else if (arg == "--dry-run") {
      isDryRun = true;
    } else if (matchesAny(arg, { "--manifest", "--path", "--os-type",
                                 "--architecture", "--repo", "--repo-override",
                                 "--registry", "--repo-prefix",
                                 "--retry-attempts", "--retry-delay-ms" })) {
      if (itr + 1 == args.end()) {
        return Subcmd::missingOptArgumentFor(arg);
      }
      const std::string_view value = *++itr;

      if (arg == "--manifest") {
        manifestPath = std::filesystem::absolute(value);
      } else if (arg == "--path") {
        viewOptions.filter.paths.emplace_back(value);
      } else if (arg == "--os-type") {
        viewOptions.filter.osType = value;
      } else if (arg == "--architecture") {
        viewOptions.filter.architecture = value;
      } else if (arg == "--repo") {
        viewOptions.filter.repos.emplace_back(value);
      } else if (arg == "--repo-override") {
        rs_try(addRepoOverride(viewOptions, value));
      } else if (arg == "--registry") {
        viewOptions.registryOverride = value;
      } else if (arg == "--repo-prefix") {
        viewOptions.repoPrefixOverride = value;
      } else if (arg == "--retry-attempts") {
        const std::uint64_t attempts = rs_try(parseCount(arg, value));
        rs_ensure(attempts > 0 && attempts <= MAX_RETRY_ATTEMPTS,
                  "`--retry-attempts` must be between 1 and {}",
                  MAX_RETRY_ATTEMPTS);
        retryPolicy.maxAttempts = static_cast<std::size_t>(attempts);
      } else {
        const std::uint64_t delayMs = rs_try(parseCount(arg, value));
        rs_ensure(
            delayMs <= static_cast<std::uint64_t>(MAX_RETRY_DELAY.count()),
            "`--retry-delay-ms` must be at most {}", MAX_RETRY_DELAY.count());
        retryPolicy.delay =
            std::chrono::milliseconds(static_cast<std::int64_t>(delayMs));
      }
    } else {
      return BUILD_CMD.noSuchArg(arg);
    }
  }

  const Manifest manifest =
      rs_try(manifestPath.has_value()
                 ? Manifest::tryParse(manifestPath.value(), false)
                 : Manifest::tryParse());
  const ManifestView view = rs_try(ManifestView::create(manifest, viewOptions));

  const DockerCli docker = DockerCli::fromEnv();
  rs_ensure(isDryRun || commandExists(docker.getExecutable()),
            "`{}` not found; install it or set IMGBUILD_DOCKER",
            docker.getExecutable());

  SystemProcessRunner runner;
  const CommandExecutor executor(runner, retryPolicy, isDryRun);
  DockerBaseImagePuller puller(executor, docker);
  AmbientIdentity identity;
  buildOptions.scriptHost = nativeScriptHost();

  Builder builder(view, buildOptions, executor, docker, puller, identity);
  rs_try(builder.run());
  return rs::Ok();
}

} // namespace imgbuild
