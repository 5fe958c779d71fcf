#pragma once

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace imgbuild {

namespace fs = std::filesystem;

class ExitStatus {
  int rawStatus{ EXIT_SUCCESS };

public:
  ExitStatus() noexcept = default;
  explicit ExitStatus(const int status) noexcept : rawStatus(status) {}

  bool exitedNormally() const noexcept;
  bool killedBySignal() const noexcept;
  int exitCode() const noexcept;
  int termSignal() const noexcept;
  bool success() const noexcept;

  std::string toString() const;
};

struct CommandOutput {
  ExitStatus exitStatus;
  std::string stdOut;
  std::string stdErr;
};

class Child {
  pid_t pid;
  int stdOutPipe;
  int stdErrPipe;

  Child(pid_t pid, int stdOutPipe, int stdErrPipe) noexcept
      : pid(pid), stdOutPipe(stdOutPipe), stdErrPipe(stdErrPipe) {}

  friend struct Command;

public:
  rs::Result<ExitStatus> wait() const noexcept;
  rs::Result<CommandOutput> waitWithOutput() const noexcept;
};

struct Command {
  enum class IOConfig : uint8_t {
    Null,
    Inherit,
    Piped,
  };

  std::string command;
  std::vector<std::string> arguments;
  std::vector<std::pair<std::string, std::string>> env;
  fs::path workingDirectory;
  IOConfig stdOutConfig = IOConfig::Inherit;
  IOConfig stdErrConfig = IOConfig::Inherit;

  explicit Command(std::string cmd) : command(std::move(cmd)) {}
  Command(std::string cmd, std::vector<std::string> args)
      : command(std::move(cmd)), arguments(std::move(args)) {}

  Command& addArg(const std::string_view arg) {
    arguments.emplace_back(arg);
    return *this;
  }
  template <typename Range>
  Command& addArgs(const Range& args) {
    for (const auto& arg : args) {
      arguments.emplace_back(arg);
    }
    return *this;
  }

  Command& setEnv(std::string name, std::string value) {
    env.emplace_back(std::move(name), std::move(value));
    return *this;
  }
  Command& setStdOutConfig(const IOConfig config) noexcept {
    stdOutConfig = config;
    return *this;
  }
  Command& setStdErrConfig(const IOConfig config) noexcept {
    stdErrConfig = config;
    return *this;
  }
  Command& setWorkingDirectory(fs::path dir) {
    workingDirectory = std::move(dir);
    return *this;
  }

  rs::Result<Child> spawn() const noexcept;
  rs::Result<CommandOutput> output() const noexcept;

  std::string toString() const;
};

rs::Result<ExitStatus> execCmd(const Command& cmd) noexcept;
rs::Result<std::string> getCmdOutput(const Command& cmd) noexcept;
bool commandExists(std::string_view cmd) noexcept;

} // namespace imgbuild

template <>
struct fmt::formatter<imgbuild::ExitStatus> : formatter<std::string> {
  auto format(const imgbuild::ExitStatus& status, format_context& ctx) const
      -> format_context::iterator {
    return formatter<std::string>::format(status.toString(), ctx);
  }
};

template <>
struct fmt::formatter<imgbuild::Command> : formatter<std::string> {
  auto format(const imgbuild::Command& cmd, format_context& ctx) const
      -> format_context::iterator {
    return formatter<std::string>::format(cmd.toString(), ctx);
  }
};
