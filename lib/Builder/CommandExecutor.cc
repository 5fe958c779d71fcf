#include "Builder/CommandExecutor.hpp"

#include "Command.hpp"
#include "Diag.hpp"

#include <chrono>
#include <cstddef>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <thread>

namespace imgbuild {

rs::Result<ExitStatus> SystemProcessRunner::run(const Command& cmd) {
  return execCmd(cmd);
}

rs::Result<void>
CommandExecutor::executeOnce(const Command& cmd,
                             const std::string_view errorMessage) const {
  const ExitStatus exitStatus = rs_try(runner.run(cmd));
  if (exitStatus.success()) {
    return rs::Ok();
  }
  if (!errorMessage.empty()) {
    rs_bail("{} ({})", errorMessage, exitStatus);
  }
  rs_bail("`{}` {}", cmd, exitStatus);
}

rs::Result<void>
CommandExecutor::execute(const Command& cmd, const bool retry,
                         const std::string_view errorMessage) const {
  if (dryRun) {
    Diag::info("Executing", "{} (dry run)", cmd);
    return rs::Ok();
  }

  const std::size_t maxAttempts =
      retry && policy.maxAttempts > 0 ? policy.maxAttempts : 1;
  for (std::size_t attempt = 1;; ++attempt) {
    auto result = executeOnce(cmd, errorMessage);
    if (result.is_ok() || attempt >= maxAttempts) {
      return result;
    }

    const auto delay = policy.delay * static_cast<long>(attempt);
    spdlog::debug("{}", result.unwrap_err()->what());
    Diag::info("Retrying", "`{}` in {}ms (attempt {} of {})", cmd,
               delay.count(), attempt + 1, maxAttempts);
    std::this_thread::sleep_for(delay);
  }
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <rs/tests.hpp>
#  include <vector>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

// Fails the first `failures` invocations with exit code 1.
class FlakyRunner final : public ProcessRunner {
public:
  explicit FlakyRunner(const std::size_t failures) : failures(failures) {}

  rs::Result<ExitStatus> run(const Command& cmd) override {
    commands.push_back(cmd.toString());
    if (commands.size() <= failures) {
      return rs::Ok(ExitStatus(1 << 8));
    }
    return rs::Ok(ExitStatus(0));
  }

  std::vector<std::string> commands;

private:
  std::size_t failures;
};

static constexpr RetryPolicy FAST_RETRY{ .maxAttempts = 3,
                                         .delay = std::chrono::milliseconds(0) };

static void testSucceedsFirstTime() {
  FlakyRunner runner(0);
  const CommandExecutor executor(runner, FAST_RETRY, false);
  assertTrue(executor.execute(Command("docker", { "push", "a:1" }), true)
                 .is_ok());
  assertEq(runner.commands.size(), 1UL);

  pass();
}

static void testNoRetry() {
  FlakyRunner runner(1);
  const CommandExecutor executor(runner, FAST_RETRY, false);
  const auto result = executor.execute(Command("docker", { "push" }), false);
  assertTrue(result.is_err());
  assertEq(result.unwrap_err()->what(),
           "`docker push` exited with code 1");
  assertEq(runner.commands.size(), 1UL);

  pass();
}

static void testRetryRecovers() {
  FlakyRunner runner(2);
  const CommandExecutor executor(runner, FAST_RETRY, false);
  assertTrue(executor.executeWithRetry(Command("docker", { "pull" })).is_ok());
  assertEq(runner.commands.size(), 3UL);

  pass();
}

static void testRetryExhausted() {
  FlakyRunner runner(10);
  const CommandExecutor executor(runner, FAST_RETRY, false);
  const auto result =
      executor.execute(Command("docker", { "build", "." }), true, "build failed");
  assertTrue(result.is_err());
  assertEq(result.unwrap_err()->what(), "build failed (exited with code 1)");
  assertEq(runner.commands.size(), 3UL);

  pass();
}

static void testDryRun() {
  FlakyRunner runner(10);
  const CommandExecutor executor(runner, FAST_RETRY, true);
  assertTrue(executor.isDryRun());
  assertTrue(executor.execute(Command("docker", { "build" }), true).is_ok());
  assertTrue(runner.commands.empty());

  pass();
}

} // namespace tests

int main() {
  tests::testSucceedsFirstTime();
  tests::testNoRetry();
  tests::testRetryRecovers();
  tests::testRetryExhausted();
  tests::testDryRun();
}

#endif
