#pragma once

#include "Command.hpp"

#include <chrono>
#include <cstddef>
#include <rs/result.hpp>
#include <string_view>

namespace imgbuild {

// Upper bounds accepted from the command line.
inline constexpr std::size_t MAX_RETRY_ATTEMPTS = 100;
inline constexpr std::chrono::milliseconds MAX_RETRY_DELAY{ 600000 };

struct RetryPolicy {
  std::size_t maxAttempts = 5;
  // Waits `delay * n` before the (n + 1)-th attempt.
  std::chrono::milliseconds delay{ 5000 };
};

class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;
  virtual rs::Result<ExitStatus> run(const Command& cmd) = 0;
};

class SystemProcessRunner final : public ProcessRunner {
public:
  rs::Result<ExitStatus> run(const Command& cmd) override;
};

// Runs external commands, once or under a retry policy.  In dry-run mode
// commands are only logged and always succeed.
class CommandExecutor {
public:
  CommandExecutor(ProcessRunner& runner, RetryPolicy policy, bool isDryRun)
      : runner(runner), policy(policy), dryRun(isDryRun) {}

  rs::Result<void> execute(const Command& cmd, bool retry,
                           std::string_view errorMessage = "") const;
  rs::Result<void> executeWithRetry(const Command& cmd) const {
    return execute(cmd, /*retry=*/true);
  }

  bool isDryRun() const noexcept { return dryRun; }
  const RetryPolicy& retryPolicy() const noexcept { return policy; }

private:
  ProcessRunner& runner;
  RetryPolicy policy;
  bool dryRun;

  rs::Result<void> executeOnce(const Command& cmd,
                               std::string_view errorMessage) const;
};

} // namespace imgbuild
