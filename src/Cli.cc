#include "Cli.hpp"

#include "Algos.hpp"
#include "Diag.hpp"
#include "TermColor.hpp"

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <span>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace imgbuild {

static constexpr std::size_t HELP_INDENT = 2;

std::size_t Opt::shortSize() const noexcept {
  return shortName.empty() ? 0 : shortName.size() + 2; // `-s, `
}

std::size_t Opt::leftSize(const std::size_t maxShortSize) const {
  std::size_t size = maxShortSize + name.size();
  if (!placeholder.empty()) {
    size += placeholder.size() + 1;
  }
  return size;
}

std::string Opt::format(const std::size_t maxShortSize,
                        const std::size_t maxOffset) const {
  std::string left;
  if (!shortName.empty()) {
    left = fmt::format("{}, ", shortName);
  }
  left = fmt::format("{:>{}}{}", left, maxShortSize, name);
  if (!placeholder.empty()) {
    left += fmt::format(" {}", placeholder);
  }

  std::string line = fmt::format("{:{}}{}", "", HELP_INDENT, Bold(Cyan(left)));
  // Escape sequences take no columns; pad by the visible width.
  line += std::string(maxOffset - left.size() + HELP_INDENT, ' ');
  line += desc;
  if (!defaultVal.empty()) {
    line += fmt::format(" [default: {}]", defaultVal);
  }
  return line;
}

std::string Arg::usage() const {
  std::string usage = required ? fmt::format("<{}>", name)
                               : fmt::format("[{}]", name);
  if (variadic) {
    usage += "...";
  }
  return usage;
}

rs::Result<void> Subcmd::exec(const CliArgsView args) const {
  rs_ensure(mainFn != nullptr, "subcommand `{}` has no main function", name);
  return mainFn(args);
}

static std::size_t
calcMaxShortSize(const std::vector<const Opt*>& opts) noexcept {
  std::size_t maxShortSize = 0;
  for (const Opt* opt : opts) {
    maxShortSize = std::max(maxShortSize, opt->shortSize());
  }
  return maxShortSize;
}

static void printOpts(const std::vector<const Opt*>& opts) {
  const std::size_t maxShortSize = calcMaxShortSize(opts);
  std::size_t maxOffset = 0;
  for (const Opt* opt : opts) {
    maxOffset = std::max(maxOffset, opt->leftSize(maxShortSize));
  }
  for (const Opt* opt : opts) {
    fmt::print("{}\n", opt->format(maxShortSize, maxOffset));
  }
}

void Subcmd::printHelp() const {
  fmt::print("{}\n\n", desc);
  fmt::print("{} {} {}{}{}\n", Bold(Green("Usage:")), Bold(Cyan("imgbuild")),
             Bold(Cyan(name)), Cyan(" [OPTIONS]"),
             arg.has_value() ? Cyan(" " + arg->usage()) : "");
  fmt::print("\n{}\n", Bold(Green("Options:")));

  std::vector<const Opt*> allOpts;
  for (const Opt& opt : getCli().getGlobalOpts()) {
    allOpts.push_back(&opt);
  }
  for (const Opt& opt : opts) {
    allOpts.push_back(&opt);
  }
  printOpts(allOpts);

  if (arg.has_value()) {
    fmt::print("\n{}\n", Bold(Green("Arguments:")));
    fmt::print("{:{}}{}  {}\n", "", HELP_INDENT, Cyan(arg->usage()),
               arg->getDesc());
  }
}

rs::Result<void> Subcmd::noSuchArg(const std::string_view arg) const {
  rs_bail("unexpected argument '{}' found\n\n"
          "For more information, try 'imgbuild help {}'",
          arg, name);
}

rs::Result<void> Subcmd::missingOptArgumentFor(const std::string_view arg) {
  rs_bail("missing argument for `{}`", arg);
}

Cli& Cli::addSubcmd(const Subcmd& subcmd) {
  subcmds.emplace(subcmd.getName(), subcmd);
  return *this;
}

const Subcmd* Cli::findSubcmd(const std::string_view subcmd) const noexcept {
  if (const auto itr = subcmds.find(subcmd); itr != subcmds.end()) {
    return &itr->second;
  }
  for (const auto& [_, cmd] : subcmds) {
    if (!cmd.getShort().empty() && cmd.getShort() == subcmd) {
      return &cmd;
    }
  }
  return nullptr;
}

bool Cli::hasSubcmd(const std::string_view subcmd) const noexcept {
  return findSubcmd(subcmd) != nullptr;
}

rs::Result<void> Cli::exec(const std::string_view subcmd,
                           const CliArgsView args) const {
  const Subcmd* cmd = findSubcmd(subcmd);
  rs_ensure(cmd != nullptr,
            "no such command: `{}`\n\n"
            "For a list of commands, try 'imgbuild help'",
            subcmd);
  return cmd->exec(args);
}

void Cli::printAllHelp() const {
  fmt::print("{}\n\n", desc);
  fmt::print("{} {} {}\n", Bold(Green("Usage:")), Bold(Cyan(name)),
             Cyan("[OPTIONS] [COMMAND]"));

  fmt::print("\n{}\n", Bold(Green("Options:")));
  std::vector<const Opt*> opts;
  for (const Opt& opt : globalOpts) {
    opts.push_back(&opt);
  }
  printOpts(opts);

  fmt::print("\n{}\n", Bold(Green("Commands:")));
  std::size_t maxNameSize = 0;
  for (const auto& [cmdName, _] : subcmds) {
    maxNameSize = std::max(maxNameSize, cmdName.size());
  }
  for (const auto& [cmdName, cmd] : subcmds) {
    fmt::print("{:{}}{}{:{}}  {}\n", "", HELP_INDENT, Bold(Cyan(cmdName)), "",
               maxNameSize - cmdName.size(), cmd.getDesc());
  }
  fmt::print("\nSee '{} help <command>' for more information on a specific "
             "command.\n",
             Bold(Cyan(name)));
}

rs::Result<void> Cli::printHelp(const CliArgsView args) const {
  if (args.empty()) {
    printAllHelp();
    return rs::Ok();
  }

  const std::string_view subcmd = args.front();
  const Subcmd* cmd = findSubcmd(subcmd);
  rs_ensure(cmd != nullptr, "no such command: `{}`", subcmd);
  cmd->printHelp();
  return rs::Ok();
}

rs::Result<Cli::ControlFlow>
Cli::handleGlobalOpts(CliArgsView::iterator& itr,
                      const CliArgsView::iterator end,
                      const std::string_view subcmd) {
  const std::string_view arg = *itr;

  if (matchesAny(arg, { "-h", "--help" })) {
    if (subcmd.empty()) {
      getCli().printAllHelp();
    } else {
      getCli().findSubcmd(subcmd)->printHelp();
    }
    return rs::Ok(Return);
  } else if (matchesAny(arg, { "-v", "--verbose" })) {
    if (Diag::getLevel() < DiagLevel::Verbose) {
      Diag::setLevel(DiagLevel::Verbose);
      spdlog::set_level(spdlog::level::debug);
    }
    return rs::Ok(Continue);
  } else if (arg == "-vv") {
    Diag::setLevel(DiagLevel::VeryVerbose);
    spdlog::set_level(spdlog::level::trace);
    return rs::Ok(Continue);
  } else if (matchesAny(arg, { "-q", "--quiet" })) {
    Diag::setLevel(DiagLevel::Off);
    spdlog::set_level(spdlog::level::err);
    return rs::Ok(Continue);
  } else if (arg == "--color") {
    if (itr + 1 == end) {
      rs_bail("missing argument for `{}`", arg);
    }
    setColorMode(*++itr);
    return rs::Ok(Continue);
  }
  return rs::Ok(Fallthrough);
}

std::vector<std::string> Cli::expandOpts(const std::span<char* const> args) {
  std::vector<std::string> expanded;
  for (const char* rawArg : args) {
    const std::string_view arg = rawArg;

    if (arg.starts_with("--") && arg.find('=') != std::string_view::npos) {
      const std::size_t eq = arg.find('=');
      expanded.emplace_back(arg.substr(0, eq));
      expanded.emplace_back(arg.substr(eq + 1));
    } else if (arg.size() > 3 && arg.starts_with("-v")
               && arg.find_first_not_of('v', 1) == std::string_view::npos) {
      // `-vvv` is as verbose as `-vv`.
      expanded.emplace_back("-vv");
    } else {
      expanded.emplace_back(arg);
    }
  }
  return expanded;
}

} // namespace imgbuild
