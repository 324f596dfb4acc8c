#pragma once

#include "core/config.hpp"

namespace conductor {

// Install the default logger: colour stderr sink plus an optional rotating file sink.
// With console == false only the file sink is installed (interactive CLI use).
void init_logging(const Config& config, bool console = true);

}  // namespace conductor
