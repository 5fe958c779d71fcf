#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <rs/result.hpp>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace imgbuild {

using CliArgsView = std::span<const std::string>;

class Opt {
public:
  explicit Opt(std::string name) : name(std::move(name)) {}

  Opt& setShort(std::string shortName) {
    this->shortName = std::move(shortName);
    return *this;
  }
  Opt& setDesc(std::string desc) {
    this->desc = std::move(desc);
    return *this;
  }
  Opt& setPlaceholder(std::string placeholder) {
    this->placeholder = std::move(placeholder);
    return *this;
  }
  Opt& setDefault(std::string defaultVal) {
    this->defaultVal = std::move(defaultVal);
    return *this;
  }
  // Width of `-s, --long <PLACEHOLDER>`.
  std::size_t leftSize(std::size_t maxShortSize) const;
  std::string format(std::size_t maxShortSize, std::size_t maxOffset) const;
  std::size_t shortSize() const noexcept;

private:
  std::string name;
  std::string shortName;
  std::string desc;
  std::string placeholder;
  std::string defaultVal;
};

class Arg {
public:
  explicit Arg(std::string name) : name(std::move(name)) {}

  Arg& setDesc(std::string desc) {
    this->desc = std::move(desc);
    return *this;
  }
  Arg& setRequired(const bool required) noexcept {
    this->required = required;
    return *this;
  }
  Arg& setVariadic(const bool variadic) noexcept {
    this->variadic = variadic;
    return *this;
  }

  // `[COMMAND]...` style usage token.
  std::string usage() const;
  const std::string& getDesc() const noexcept { return desc; }

private:
  std::string name;
  std::string desc;
  bool required = true;
  bool variadic = false;
};

class Subcmd {
public:
  using MainFn = rs::Result<void>(CliArgsView);

  explicit Subcmd(std::string name) : name(std::move(name)) {}

  Subcmd& setShort(std::string shortName) {
    this->shortName = std::move(shortName);
    return *this;
  }
  Subcmd& setDesc(std::string desc) {
    this->desc = std::move(desc);
    return *this;
  }
  Subcmd& addOpt(Opt opt) {
    opts.emplace_back(std::move(opt));
    return *this;
  }
  Subcmd& setArg(Arg arg) {
    this->arg = std::move(arg);
    return *this;
  }
  Subcmd& setMainFn(std::function<MainFn> mainFn) {
    this->mainFn = std::move(mainFn);
    return *this;
  }

  const std::string& getName() const noexcept { return name; }
  const std::string& getShort() const noexcept { return shortName; }
  const std::string& getDesc() const noexcept { return desc; }

  rs::Result<void> exec(CliArgsView args) const;
  void printHelp() const;

  rs::Result<void> noSuchArg(std::string_view arg) const;
  static rs::Result<void> missingOptArgumentFor(std::string_view arg);

private:
  std::string name;
  std::string shortName;
  std::string desc;
  std::vector<Opt> opts;
  std::optional<Arg> arg;
  std::function<MainFn> mainFn;
};

class Cli {
public:
  enum ControlFlow : std::uint8_t {
    Return,
    Continue,
    Fallthrough,
  };

  Cli(std::string name, std::string desc)
      : name(std::move(name)), desc(std::move(desc)) {}

  Cli& addSubcmd(const Subcmd& subcmd);
  Cli& addOpt(Opt opt) {
    globalOpts.emplace_back(std::move(opt));
    return *this;
  }

  bool hasSubcmd(std::string_view subcmd) const noexcept;
  const Subcmd* findSubcmd(std::string_view subcmd) const noexcept;
  const std::vector<Opt>& getGlobalOpts() const noexcept { return globalOpts; }

  rs::Result<void> exec(std::string_view subcmd, CliArgsView args) const;
  void printAllHelp() const;
  rs::Result<void> printHelp(CliArgsView args) const;

  // Handles `-h`, `-v`, `-vv`, `-q` and `--color`, which every subcommand
  // accepts.  `subcmd` is empty at the top level.
  static rs::Result<ControlFlow>
  handleGlobalOpts(CliArgsView::iterator& itr, CliArgsView::iterator end,
                   std::string_view subcmd = "");

  // `-vvv` -> `-vv`; `--opt=value` -> `--opt value`.
  static std::vector<std::string> expandOpts(std::span<char* const> args);

private:
  std::string name;
  std::string desc;
  std::vector<Opt> globalOpts;
  std::map<std::string, Subcmd, std::less<>> subcmds;
};

const Cli& getCli();

} // namespace imgbuild
