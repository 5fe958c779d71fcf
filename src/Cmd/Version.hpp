#pragma once

#include "Cli.hpp"

namespace imgbuild {

extern const Subcmd VERSION_CMD;

} // namespace imgbuild
