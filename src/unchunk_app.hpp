#pragma once

#include "app_options.hpp"

// Processes every input tree in parallel, appends the run report when one was
// requested and returns the process exit status. Overlapping input trees
// throw std::invalid_argument before any tree is touched.
int run_unchunk(const App_options& app_options);
