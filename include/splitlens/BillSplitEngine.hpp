#pragma once

#include "splitlens/Models.hpp"
#include "splitlens/SplitConfig.hpp"

namespace splitlens {

// validate -> allocate -> reconcile -> explain.
// Throws BillSplitError on any fatal condition; never returns a partial result.
SplitResult compute_splits(const Session& session, const SplitConfig& cfg = {});

}  // namespace splitlens
