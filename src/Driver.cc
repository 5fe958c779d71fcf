#include "Driver.hpp"

#include "Cli.hpp"
#include "Cmd/Build.hpp"
#include "Cmd/Help.hpp"
#include "Cmd/Version.hpp"
#include "Diag.hpp"

#include <cstddef>
#include <exception>
#include <rs/result.hpp>
#include <span>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imgbuild {

const Cli& getCli() {
  static const Cli cli = [] {
    Cli cli("imgbuild", "Builds, tags and pushes container images described "
                        "by a manifest");
    cli.addOpt(Opt{ "--verbose" }.setShort("-v").setDesc(
               "Use verbose output (-vv very verbose output)"))
        .addOpt(Opt{ "--quiet" }.setShort("-q").setDesc(
            "Do not print imgbuild log messages"))
        .addOpt(Opt{ "--color" }
                    .setDesc("Coloring: auto, always, never")
                    .setPlaceholder("<WHEN>")
                    .setDefault("auto"))
        .addOpt(Opt{ "--help" }.setShort("-h").setDesc("Print help"))
        .addSubcmd(BUILD_CMD)
        .addSubcmd(HELP_CMD)
        .addSubcmd(VERSION_CMD);
    return cli;
  }();
  return cli;
}

static void setupLogger() {
  auto logger = spdlog::stderr_color_mt("imgbuild");
  logger->set_pattern("%^%l%$: %v");
  spdlog::set_default_logger(std::move(logger));
  spdlog::set_level(spdlog::level::info);
}

// NOLINTNEXTLINE(*-avoid-c-arrays)
static rs::Result<void> runImpl(const int argc, char* argv[]) {
  setupLogger();

  const std::vector<std::string> args = Cli::expandOpts(
      std::span<char* const>(argv + 1, static_cast<std::size_t>(argc - 1)));
  const CliArgsView argsView(args);
  for (auto itr = argsView.begin(); itr != argsView.end(); ++itr) {
    const std::string_view arg = *itr;

    const auto control = rs_try(Cli::handleGlobalOpts(itr, argsView.end()));
    if (control == Cli::Return) {
      return rs::Ok();
    } else if (control == Cli::Continue) {
      continue;
    } else if (arg == "-V" || arg == "--version") {
      return getCli().exec("version", CliArgsView(itr + 1, argsView.end()));
    } else if (getCli().hasSubcmd(arg)) {
      return getCli().exec(arg, CliArgsView(itr + 1, argsView.end()));
    } else {
      rs_bail("no such command: `{}`\n\n"
              "For a list of commands, try 'imgbuild help'",
              arg);
    }
  }

  getCli().printAllHelp();
  return rs::Ok();
}

// NOLINTNEXTLINE(*-avoid-c-arrays)
rs::Result<void, void> run(const int argc, char* argv[]) noexcept {
  try {
    const auto result = runImpl(argc, argv);
    if (result.is_err()) {
      Diag::error("{}", result.unwrap_err()->what());
      return rs::Err();
    }
    return rs::Ok();
  } catch (const std::exception& e) {
    Diag::error("{}", e.what());
    return rs::Err();
  }
}

} // namespace imgbuild
