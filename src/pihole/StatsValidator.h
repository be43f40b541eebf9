#pragma once
#include "Stats.h"

namespace netscene {

// Domain sanity checks on a parsed summary. Throws PiholeError(ValidationError) naming
// the first violated constraint. Negative percentages are not rejected.
void validate_stats(const Stats& stats);

}
