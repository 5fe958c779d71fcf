#pragma once

#include "Cli.hpp"

namespace imgbuild {

extern const Subcmd BUILD_CMD;

} // namespace imgbuild
