#pragma once

#include <filesystem>
#include <optional>
#include <rs/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace imgbuild {

namespace fs = std::filesystem;

struct FromInstruction {
  std::string image;
  std::optional<std::string> stageName; // `FROM <image> AS <stageName>`
  std::optional<std::string> platform;  // `FROM --platform=<platform> ...`
};

std::vector<FromInstruction> parseFromInstructions(std::string_view text);

// Replaces every `FROM <oldRef>` in `text` with `FROM <newRef>`.  The
// reference must be followed by whitespace or the end of the text, and
// whitespace trailing it on the same line is dropped unless more of the
// instruction (e.g. `AS build`) follows.
std::string rewriteFromReferences(const std::string& text,
                                  std::string_view oldRef,
                                  std::string_view newRef);

rs::Result<std::string> readTextFile(const fs::path& path);
rs::Result<void> writeTextFile(const fs::path& path, std::string_view text);

} // namespace imgbuild
