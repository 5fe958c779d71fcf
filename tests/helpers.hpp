#pragma once

#include "Builder/BaseImages.hpp"
#include "Builder/CommandExecutor.hpp"
#include "Builder/IdentityScope.hpp"
#include "Command.hpp"
#include "ManifestView.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <random>
#include <rs/result.hpp>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace tests {

namespace fs = std::filesystem;

inline fs::path imgbuildBinary() {
  if (const char* env = std::getenv("IMGBUILD")) {
    return fs::path(env);
  }
  return fs::current_path() / "imgbuild";
}

struct RunResult {
  imgbuild::ExitStatus status;
  std::string out;
  std::string err;
};

inline rs::Result<RunResult> runImgbuild(const std::vector<std::string>& args,
                                         const fs::path& workdir = {}) {
  imgbuild::Command cmd(imgbuildBinary().string());
  cmd.setEnv("IMGBUILD_TERM_COLOR", "never");
  for (const auto& arg : args) {
    cmd.addArg(arg);
  }
  if (!workdir.empty()) {
    cmd.setWorkingDirectory(workdir);
  }
  cmd.setStdOutConfig(imgbuild::Command::IOConfig::Piped);
  cmd.setStdErrConfig(imgbuild::Command::IOConfig::Piped);

  const imgbuild::CommandOutput output = rs_try(cmd.output());
  return rs::Ok(RunResult{ output.exitStatus, output.stdOut, output.stdErr });
}

inline rs::Result<RunResult>
runImgbuild(std::initializer_list<std::string> args,
            const fs::path& workdir = {}) {
  return runImgbuild(std::vector<std::string>(args), workdir);
}

struct TempDir {
  fs::path path;

  TempDir()
      : path([] {
          const auto epoch =
              std::chrono::steady_clock::now().time_since_epoch();
          const auto ticks =
              std::chrono::duration_cast<std::chrono::nanoseconds>(epoch)
                  .count();
          const auto random =
              static_cast<std::uint64_t>(std::random_device{}());
          std::ostringstream oss;
          oss << "imgbuild-test-" << random << '-' << ticks;
          return fs::temp_directory_path() / oss.str();
        }()) {
    fs::create_directories(path);
  }

  ~TempDir() {
    if (path.empty()) {
      return;
    }
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  TempDir(TempDir&& other) noexcept : path(std::move(other.path)) {
    other.path.clear();
  }

  TempDir& operator=(TempDir&& other) noexcept {
    if (this != &other) {
      path = std::move(other.path);
      other.path.clear();
    }
    return *this;
  }

  [[nodiscard]] fs::path operator/(const fs::path& relative) const {
    return path / relative;
  }
};

inline std::string readFile(const fs::path& file) {
  std::ifstream ifs(file);
  return std::string(std::istreambuf_iterator<char>(ifs), {});
}

inline void writeFile(const fs::path& file, const std::string& content) {
  fs::create_directories(file.parent_path());
  std::ofstream ofs(file);
  ofs << content;
}

inline bool contains(const std::string_view haystack,
                     const std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

// Records every command instead of spawning it.  Commands whose rendering
// contains `failPattern` exit with code 1, at most `failCount` times.
class RecordingRunner final : public imgbuild::ProcessRunner {
public:
  struct Invocation {
    std::string command;
    fs::path workingDirectory;
  };

  RecordingRunner() = default;
  RecordingRunner(std::string failPattern, const std::size_t failCount)
      : failPattern(std::move(failPattern)), failCount(failCount) {}

  rs::Result<imgbuild::ExitStatus>
  run(const imgbuild::Command& cmd) override {
    const std::string rendered = cmd.toString();
    invocations.push_back(Invocation{ .command = rendered,
                                      .workingDirectory =
                                          cmd.workingDirectory });
    if (onRun) {
      onRun(cmd);
    }
    if (!failPattern.empty() && failures < failCount
        && contains(rendered, failPattern)) {
      ++failures;
      return rs::Ok(imgbuild::ExitStatus(1 << 8));
    }
    return rs::Ok(imgbuild::ExitStatus(0));
  }

  std::vector<std::string> commands() const {
    std::vector<std::string> commands;
    commands.reserve(invocations.size());
    for (const Invocation& invocation : invocations) {
      commands.push_back(invocation.command);
    }
    return commands;
  }

  std::vector<std::string> commandsContaining(std::string_view part) const {
    std::vector<std::string> matched;
    for (const Invocation& invocation : invocations) {
      if (contains(invocation.command, part)) {
        matched.push_back(invocation.command);
      }
    }
    return matched;
  }

  std::vector<Invocation> invocations;
  // Called before the result is decided, e.g. to inspect files a build reads.
  std::function<void(const imgbuild::Command&)> onRun;

private:
  std::string failPattern;
  std::size_t failCount = 0;
  std::size_t failures = 0;
};

class CountingPuller final : public imgbuild::BaseImagePuller {
public:
  rs::Result<void> pullBaseImages(const imgbuild::ManifestView&) override {
    ++calls;
    return rs::Ok();
  }

  std::size_t calls = 0;
};

class RecordingIdentity final : public imgbuild::IdentityScope {
public:
  rs::Result<void>
  runAs(const std::function<rs::Result<void>()>& work) override {
    ++entered;
    return work();
  }

  std::size_t entered = 0;
};

inline constexpr imgbuild::RetryPolicy NO_DELAY_RETRY{
  .maxAttempts = 3, .delay = std::chrono::milliseconds(0)
};

} // namespace tests
