#pragma once

#include <rs/result.hpp>

namespace imgbuild {

// Entry point of the `imgbuild` executable.  Sets up the stderr logger,
// applies the global options, and dispatches to `build`, `help` or `version`.
// Failures are reported through Diag::error before Err is returned, so the
// caller only maps the result to an exit code.
// NOLINTNEXTLINE(*-avoid-c-arrays)
rs::Result<void, void> run(int argc, char* argv[]) noexcept;

} // namespace imgbuild
