#include "splitlens/BillSplitEngine.hpp"

#include "splitlens/Allocator.hpp"
#include "splitlens/CentReconciler.hpp"
#include "splitlens/SettlementGenerator.hpp"
#include "splitlens/Validator.hpp"

#include <utility>

namespace splitlens {

SplitResult compute_splits(const Session& session, const SplitConfig& cfg) {
    SplitResult res;

    PreflightResult pre = validate_session(session);
    res.warnings = std::move(pre.warnings);

    if (!pre.proceed) return res;

    const Allocation alloc = allocate(session);
    res.allocated_total = alloc.allocated_total;

    check_variance(alloc.allocated_total, session.entered_total, cfg, res.warnings);

    res.person_totals = reconcile_cents(alloc.person_cents, session.participants, session.entered_total);
    res.settlements = generate_settlements(session, res.person_totals, cfg);

    return res;
}

}  // namespace splitlens
