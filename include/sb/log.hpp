#pragma once

#include <spdlog/spdlog.h>

#include "sb/options.hpp"

namespace sb
{
// Installs the colored stderr logger used by every component.
void init_logging(LogLevel level);
} // namespace sb
