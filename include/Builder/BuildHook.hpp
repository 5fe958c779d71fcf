#pragma once

#include "Builder/CommandExecutor.hpp"
#include "Command.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <utility>

namespace imgbuild {

namespace fs = std::filesystem;

inline constexpr std::string_view PRE_BUILD_HOOK = "pre-build";
inline constexpr std::string_view POST_BUILD_HOOK = "post-build";

// Interpreter used for hooks that are not directly executable.
struct ScriptHost {
  std::string interpreter;
  std::string extension; // including the leading dot
};

// PowerShell on Windows and pwsh elsewhere; `$IMGBUILD_HOOK_SHELL` overrides
// the interpreter.
ScriptHost nativeScriptHost();

class HookScript {
public:
  virtual ~HookScript() = default;

  const fs::path& getPath() const noexcept { return path; }
  virtual Command makeCommand() const = 0;

protected:
  explicit HookScript(fs::path path) : path(std::move(path)) {}

private:
  fs::path path;
};

class ExecutableHook final : public HookScript {
public:
  explicit ExecutableHook(fs::path path) : HookScript(std::move(path)) {}

  Command makeCommand() const override;
};

class InterpretedHook final : public HookScript {
public:
  InterpretedHook(fs::path path, ScriptHost host)
      : HookScript(std::move(path)), host(std::move(host)) {}

  Command makeCommand() const override;

private:
  ScriptHost host;
};

// `<context>/hooks/<name>` if present, else `<context>/hooks/<name><ext>`.
std::unique_ptr<HookScript> findBuildHook(std::string_view name,
                                          const fs::path& buildContext,
                                          const ScriptHost& host);

class HookInvoker {
public:
  HookInvoker(const CommandExecutor& executor, ScriptHost host)
      : executor(executor), host(std::move(host)) {}

  // Runs the named hook with the build context as its working directory.
  // A missing hook is not an error.
  rs::Result<void> invoke(std::string_view name,
                          const fs::path& buildContext) const;

private:
  const CommandExecutor& executor;
  ScriptHost host;
};

} // namespace imgbuild
