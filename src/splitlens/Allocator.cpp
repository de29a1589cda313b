#include "splitlens/Allocator.hpp"

namespace splitlens {

Allocation allocate(const Session& session) {
    Allocation out;

    for (const auto& p : session.participants) out.person_cents[p] = 0.0;

    const size_t roster_size = session.participants.size();

    for (const auto& item : session.items) {
        if (!item.assignment.is_assigned()) continue;

        // Quantity is already part of the line total.
        const size_t n = item.assignment.sharing_count(roster_size);
        if (n == 0) continue;

        const double share = static_cast<double>(item.amount) / static_cast<double>(n);

        if (item.assignment.kind == AssignmentKind::Everyone) {
            for (const auto& p : session.participants) out.person_cents[p] += share;
        } else {
            for (const auto& p : item.assignment.members) out.person_cents[p] += share;
        }

        out.allocated_total += item.amount;
    }

    return out;
}

}  // namespace splitlens
