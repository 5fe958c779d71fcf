#include "Command.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <poll.h>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace imgbuild {

bool ExitStatus::exitedNormally() const noexcept {
  return WIFEXITED(rawStatus);
}

bool ExitStatus::killedBySignal() const noexcept {
  return WIFSIGNALED(rawStatus);
}

int ExitStatus::exitCode() const noexcept {
  if (!exitedNormally()) {
    return -1;
  }
  return WEXITSTATUS(rawStatus);
}

int ExitStatus::termSignal() const noexcept {
  if (!killedBySignal()) {
    return -1;
  }
  return WTERMSIG(rawStatus);
}

bool ExitStatus::success() const noexcept {
  return exitedNormally() && exitCode() == EXIT_SUCCESS;
}

std::string ExitStatus::toString() const {
  if (exitedNormally()) {
    return fmt::format("exited with code {}", exitCode());
  } else if (killedBySignal()) {
    return fmt::format("killed by signal {}", termSignal());
  }
  return "terminated abnormally";
}

static void closeFd(const int fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
  }
}

rs::Result<ExitStatus> Child::wait() const noexcept {
  closeFd(stdOutPipe);
  closeFd(stdErrPipe);

  int status{};
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      rs_bail("waitpid() failed: {}", std::strerror(errno));
    }
  }
  return rs::Ok(ExitStatus(status));
}

rs::Result<CommandOutput> Child::waitWithOutput() const noexcept {
  std::string stdOut;
  std::string stdErr;

  std::vector<pollfd> fds;
  if (stdOutPipe >= 0) {
    fds.push_back(pollfd{ .fd = stdOutPipe, .events = POLLIN, .revents = 0 });
  }
  if (stdErrPipe >= 0) {
    fds.push_back(pollfd{ .fd = stdErrPipe, .events = POLLIN, .revents = 0 });
  }

  std::array<char, 4096> buffer{};
  while (!fds.empty()) {
    if (::poll(fds.data(), fds.size(), -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      rs_bail("poll() failed: {}", std::strerror(errno));
    }

    for (auto itr = fds.begin(); itr != fds.end();) {
      if (itr->revents == 0) {
        ++itr;
        continue;
      }

      const ssize_t count = ::read(itr->fd, buffer.data(), buffer.size());
      if (count > 0) {
        std::string& sink = itr->fd == stdOutPipe ? stdOut : stdErr;
        sink.append(buffer.data(), static_cast<std::size_t>(count));
        ++itr;
      } else if (count == -1 && errno == EINTR) {
        ++itr;
      } else {
        ::close(itr->fd);
        itr = fds.erase(itr);
      }
    }
  }

  int status{};
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      rs_bail("waitpid() failed: {}", std::strerror(errno));
    }
  }
  return rs::Ok(CommandOutput{ .exitStatus = ExitStatus(status),
                               .stdOut = std::move(stdOut),
                               .stdErr = std::move(stdErr) });
}

// The current environment as `NAME=value` entries with `overrides` applied;
// a later override of the same name wins.
static std::vector<std::string> mergeEnvironment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
  std::vector<std::string> entries;
  for (char** itr = environ; itr != nullptr && *itr != nullptr; ++itr) {
    entries.emplace_back(*itr);
  }
  for (const auto& [name, value] : overrides) {
    const std::string prefix = name + '=';
    std::erase_if(entries, [&](const std::string& entry) {
      return entry.starts_with(prefix);
    });
    entries.push_back(prefix + value);
  }
  return entries;
}

const Command::IOConfig config,
                            const std::array<int, 2>& pipeFds,
                            const int targetFd) noexcept {
  switch (config) {
  case Command::IOConfig::Null: {
    const int devNull = ::open("/dev/null", O_WRONLY);
    if (devNull >= 0) {
      ::dup2(devNull, targetFd);
      ::close(devNull);
    }
    break;
  }
  case Command::IOConfig::Piped:
    ::close(pipeFds[0]);
    ::dup2(pipeFds[1], targetFd);
    ::close(pipeFds[1]);
    break;
  case Command::IOConfig::Inherit:
    break;
  }
}

rs::Result<Child> Command::spawn() const noexcept {
  std::array<int, 2> stdOutPipe{ -1, -1 };
  std::array<int, 2> stdErrPipe{ -1, -1 };

  if (stdOutConfig == IOConfig::Piped && ::pipe(stdOutPipe.data()) == -1) {
    rs_bail("pipe() failed: {}", std::strerror(errno));
  }
  if (stdErrConfig == IOConfig::Piped && ::pipe(stdErrPipe.data()) == -1) {
    closeFd(stdOutPipe[0]);
    closeFd(stdOutPipe[1]);
    rs_bail("pipe() failed: {}", std::strerror(errno));
  }

  // Build argv and envp before forking; only async-signal-safe calls in the
  // child.
  std::vector<char*> argv;
  argv.reserve(arguments.size() + 2);
  argv.push_back(const_cast<char*>(command.c_str()));
  for (const std::string& arg : arguments) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const std::vector<std::string> environment = mergeEnvironment(env);
  std::vector<char*> envp;
  envp.reserve(environment.size() + 1);
  for (const std::string& entry : environment) {
    envp.push_back(const_cast<char*>(entry.c_str()));
  }
  envp.push_back(nullptr);

  const std::string workDir = workingDirectory.string();

  const pid_t pid = ::fork();
  if (pid == -1) {
    rs_bail("fork() failed: {}", std::strerror(errno));
  } else if (pid == 0) {
    redirectInChild(stdOutConfig, stdOutPipe, STDOUT_FILENO);
    redirectInChild(stdErrConfig, stdErrPipe, STDERR_FILENO);

    if (!workDir.empty() && ::chdir(workDir.c_str()) == -1) {
      _exit(126);
    }
    ::execvpe(command.c_str(), argv.data(), envp.data());
    _exit(127); // command not found or not executable
  }

  if (stdOutConfig == IOConfig::Piped) {
    ::close(stdOutPipe[1]);
  }
  if (stdErrConfig == IOConfig::Piped) {
    ::close(stdErrPipe[1]);
  }
  spdlog::trace("spawned `{}` (pid {})", toString(), pid);
  return rs::Ok(Child(pid, stdOutPipe[0], stdErrPipe[0]));
}

rs::Result<CommandOutput> Command::output() const noexcept {
  Command cmd = *this;
  if (cmd.stdOutConfig == IOConfig::Inherit) {
    cmd.stdOutConfig = IOConfig::Piped;
  }
  if (cmd.stdErrConfig == IOConfig::Inherit) {
    cmd.stdErrConfig = IOConfig::Piped;
  }
  return rs_try(cmd.spawn()).waitWithOutput();
}

static std::string quoteIfNeeded(const std::string_view arg) {
  if (!arg.empty()
      && arg.find_first_of(" \t\"'\\$") == std::string_view::npos) {
    return std::string(arg);
  }
  std::string quoted = "\"";
  for (const char c : arg) {
    if (c == '"' || c == '\\' || c == '$') {
      quoted.push_back('\\');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

std::string Command::toString() const {
  std::string res = quoteIfNeeded(command);
  for (const std::string& arg : arguments) {
    res += ' ' + quoteIfNeeded(arg);
  }
  return res;
}

rs::Result<ExitStatus> execCmd(const Command& cmd) noexcept {
  spdlog::debug("Running `{}`", cmd.toString());
  return rs_try(cmd.spawn()).wait();
}

rs::Result<std::string> getCmdOutput(const Command& cmd) noexcept {
  spdlog::trace("Running `{}`", cmd.toString());
  const CommandOutput output = rs_try(cmd.output());
  rs_ensure(output.exitStatus.success(), "`{}` {}:\n{}", cmd.toString(),
            output.exitStatus, output.stdErr);
  return rs::Ok(output.stdOut);
}

bool commandExists(const std::string_view cmd) noexcept {
  const Command checkCmd =
      Command("sh")
          .addArg("-c")
          .addArg(fmt::format("command -v {}", quoteIfNeeded(cmd)))
          .setStdOutConfig(Command::IOConfig::Null)
          .setStdErrConfig(Command::IOConfig::Null);
  const auto status = execCmd(checkCmd);
  return status.is_ok() && status.unwrap().success();
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <rs/tests.hpp>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static void testCommandToString() {
  const Command cmd = Command("docker")
                          .addArg("build")
                          .addArg("-t")
                          .addArg("repo:tag")
                          .addArg("--build-arg")
                          .addArg("GREETING=hello world");
  assertEq(cmd.toString(),
           "docker build -t repo:tag --build-arg \"GREETING=hello world\"");

  pass();
}

static void testExitStatus() {
  const CommandOutput ok = Command("sh").addArg("-c").addArg("exit 0")
                               .output()
                               .unwrap();
  assertTrue(ok.exitStatus.success());

  const CommandOutput failed = Command("sh").addArg("-c").addArg("exit 3")
                                   .output()
                                   .unwrap();
  assertFalse(failed.exitStatus.success());
  assertEq(failed.exitStatus.exitCode(), 3);
  assertEq(failed.exitStatus.toString(), "exited with code 3");

  pass();
}

static void testCapturesOutput() {
  const std::string out =
      getCmdOutput(Command("sh").addArg("-c").addArg("printf hello"))
          .unwrap();
  assertEq(out, "hello");

  const CommandOutput output =
      Command("sh").addArg("-c").addArg("printf oops >&2").output().unwrap();
  assertEq(output.stdErr, "oops");
  assertTrue(output.stdOut.empty());

  pass();
}

static void testEnvironment() {
  const std::string out =
      getCmdOutput(Command("sh")
                       .addArg("-c")
                       .addArg("printf '%s' \"$IMGBUILD_GREETING\"")
                       .setEnv("IMGBUILD_GREETING", "hello")
                       .setEnv("IMGBUILD_GREETING", "world"))
          .unwrap();
  assertEq(out, "world");

  const std::vector<std::string> merged =
      mergeEnvironment({ { "IMGBUILD_GREETING", "hello" } });
  assertEq(std::count(merged.begin(), merged.end(),
                      std::string("IMGBUILD_GREETING=hello")),
           1L);

  pass();
}

static void testWorkingDirectory() {
  const std::string out = getCmdOutput(Command("pwd").setWorkingDirectory("/"))
                              .unwrap();
  assertEq(out, "/\n");

  pass();
}

} // namespace tests

int main() {
  tests::testCommandToString();
  tests::testExitStatus();
  tests::testCapturesOutput();
  tests::testWorkingDirectory();
  tests::testEnvironment();
}

#endif
