#pragma once

#include <string>
#include <string_view>

namespace imgbuild {

// Repository part of an image reference, without its `:tag` or `@digest`
// suffix: `mcr.example.com:5000/dotnet/runtime:8.0` -> `mcr.example.com:5000/
// dotnet/runtime`.
std::string getRepo(std::string_view imageRef);

// The `:tag`, `@digest` or `:tag@digest` suffix of an image reference,
// including its leading separator; empty when the reference has neither.
std::string getTagSuffix(std::string_view imageRef);

// Substitutes the repository of `imageRef`, preserving its tag/digest suffix.
std::string replaceRepo(std::string_view imageRef, std::string_view newRepo);

// `<repo>:<tag>`
std::string qualifyTag(std::string_view repo, std::string_view tag);

} // namespace imgbuild
