#pragma once

#include "Cli.hpp"

namespace imgbuild {

extern const Subcmd HELP_CMD;

} // namespace imgbuild
