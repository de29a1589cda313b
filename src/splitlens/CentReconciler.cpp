#include "splitlens/CentReconciler.hpp"

#include <algorithm>
#include <cmath>

namespace splitlens {

std::map<std::string, Cents> reconcile_cents(
    const std::map<std::string, double>& person_cents,
    const std::vector<std::string>& participants,
    Cents target_total
) {
    std::map<std::string, Cents> adjusted;
    for (const auto& p : participants) adjusted[p] = 0;

    Cents base = 0;
    for (const auto& kv : person_cents) {
        const Cents c = static_cast<Cents>(std::llround(kv.second));
        adjusted[kv.first] = c;
        base += c;
    }

    const Cents remainder = target_total - base;
    if (remainder == 0 || participants.empty()) return adjusted;

    std::vector<std::string> order = participants;
    std::sort(order.begin(), order.end());

    const Cents step = remainder > 0 ? 1 : -1;
    const Cents count = remainder > 0 ? remainder : -remainder;
    const Cents n = static_cast<Cents>(order.size());

    // Whole laps of the round-robin first, then the partial lap in sorted order.
    const Cents laps = count / n;
    const Cents extra = count % n;

    for (Cents i = 0; i < n; ++i) {
        adjusted[order[static_cast<size_t>(i)]] += step * (laps + (i < extra ? 1 : 0));
    }

    return adjusted;
}

}  // namespace splitlens
