#pragma once

#include "options.h"

namespace panewm {

// Open a resizable raylib window hosting the configured panes and run until it closes.
void run_demo(GlobalOptionsProvider& options_provider);

} // namespace panewm
