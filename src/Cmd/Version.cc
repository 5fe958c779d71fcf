#include "Version.hpp"

#include "Cli.hpp"

#include <fmt/core.h>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string_view>

#ifndef IMGBUILD_PKG_VERSION
#  error "IMGBUILD_PKG_VERSION is not defined"
#endif

namespace imgbuild {

static rs::Result<void> versionMain(CliArgsView args) noexcept;

const Subcmd VERSION_CMD = //
    Subcmd{ "version" }
        .setDesc("Show version information")
        .setMainFn(versionMain);

static rs::Result<void> versionMain(const CliArgsView args) noexcept {
  for (auto itr = args.begin(); itr != args.end(); ++itr) {
    const auto control = rs_try(Cli::handleGlobalOpts(itr, args.end(), "version"));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else {
      return VERSION_CMD.noSuchArg(*itr);
    }
  }

  fmt::print("imgbuild {}\n", IMGBUILD_PKG_VERSION);
  spdlog::debug("compiled with {} on {}", __VERSION__, __DATE__);
  return rs::Ok();
}

} // namespace imgbuild
