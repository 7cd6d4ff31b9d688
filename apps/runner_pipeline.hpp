#pragma once

#include "runner_shared.hpp"

namespace ptsrc::runner {

// Blind detection over the configured regions
int run_find_command(const CommandOptions &opts);

// Joint amplitude fit at the positions of an input catalog
int run_fit_command(const CommandOptions &opts);

// Concatenate catalogs and merge their duplicates
int run_merge_catalogs_command(const CommandOptions &opts);

} // namespace ptsrc::runner
