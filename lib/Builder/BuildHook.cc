#include "Builder/BuildHook.hpp"

#include "Command.hpp"
#include "Diag.hpp"

#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/std.h>
#include <memory>
#include <rs/result.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <system_error>

namespace imgbuild {

ScriptHost nativeScriptHost() {
#ifdef _WIN32
  ScriptHost host{ .interpreter = "PowerShell", .extension = ".ps1" };
#else
  ScriptHost host{ .interpreter = "pwsh", .extension = ".ps1" };
#endif
  if (const char* shell = std::getenv("IMGBUILD_HOOK_SHELL");
      shell != nullptr && *shell != '\0') {
    host.interpreter = shell;
  }
  return host;
}

Command ExecutableHook::makeCommand() const {
  return Command(getPath().string());
}

Command InterpretedHook::makeCommand() const {
  return Command(host.interpreter, { "-NoProfile", "-File" })
      .addArg(getPath().string());
}

static bool isRegularFile(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

std::unique_ptr<HookScript> findBuildHook(const std::string_view name,
                                          const fs::path& buildContext,
                                          const ScriptHost& host) {
  const fs::path hooksDir = buildContext / "hooks";
  std::error_code ec;
  if (!fs::is_directory(hooksDir, ec)) {
    return nullptr;
  }

  const fs::path direct = hooksDir / name;
  if (isRegularFile(direct)) {
    return std::make_unique<ExecutableHook>(direct);
  }

  const fs::path script = hooksDir / fmt::format("{}{}", name, host.extension);
  if (isRegularFile(script)) {
    return std::make_unique<InterpretedHook>(script, host);
  }
  return nullptr;
}

rs::Result<void> HookInvoker::invoke(const std::string_view name,
                                     const fs::path& buildContext) const {
  const std::unique_ptr<HookScript> hook =
      findBuildHook(name, buildContext, host);
  if (hook == nullptr) {
    spdlog::trace("no {} hook in {}", name, buildContext);
    return rs::Ok();
  }

  Diag::info("Running", "{} hook {}", name, hook->getPath().string());
  Command cmd = hook->makeCommand();
  cmd.setWorkingDirectory(buildContext);
  return executor.execute(
      cmd, /*retry=*/false,
      fmt::format("failed to execute build hook '{}'", hook->getPath().string()));
}

} // namespace imgbuild

#ifdef IMGBUILD_TEST

#  include <fstream>
#  include <rs/tests.hpp>
#  include <unistd.h>

namespace tests {

using namespace imgbuild; // NOLINT(build/namespaces,google-build-using-namespace)

static const ScriptHost TEST_HOST{ .interpreter = "pwsh", .extension = ".ps1" };

static fs::path makeContext(const std::string_view name) {
  const fs::path dir = fs::temp_directory_path()
                       / fmt::format("imgbuild-hook-{}-{}", name, ::getpid());
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static void touch(const fs::path& path) {
  fs::create_directories(path.parent_path());
  std::ofstream(path) << "exit 0\n";
}

static void testNoHooksDir() {
  const fs::path ctx = makeContext("none");
  assertTrue(findBuildHook(PRE_BUILD_HOOK, ctx, TEST_HOST) == nullptr);
  fs::remove_all(ctx);

  pass();
}

static void testDirectHookWins() {
  const fs::path ctx = makeContext("direct");
  touch(ctx / "hooks" / "pre-build");
  touch(ctx / "hooks" / "pre-build.ps1");

  const auto hook = findBuildHook(PRE_BUILD_HOOK, ctx, TEST_HOST);
  assertTrue(hook != nullptr);
  assertEq(hook->getPath(), ctx / "hooks" / "pre-build");
  assertEq(hook->makeCommand().toString(), (ctx / "hooks" / "pre-build").string());
  fs::remove_all(ctx);

  pass();
}

static void testInterpretedHook() {
  const fs::path ctx = makeContext("script");
  touch(ctx / "hooks" / "post-build.ps1");

  assertTrue(findBuildHook(PRE_BUILD_HOOK, ctx, TEST_HOST) == nullptr);
  const auto hook = findBuildHook(POST_BUILD_HOOK, ctx, TEST_HOST);
  assertTrue(hook != nullptr);
  const Command cmd = hook->makeCommand();
  assertEq(cmd.command, "pwsh");
  assertEq(cmd.arguments,
           std::vector<std::string>{
               "-NoProfile", "-File",
               (ctx / "hooks" / "post-build.ps1").string() });
  fs::remove_all(ctx);

  pass();
}

} // namespace tests

int main() {
  tests::testNoHooksDir();
  tests::testDirectHookWins();
  tests::testInterpretedHook();
}

#endif
