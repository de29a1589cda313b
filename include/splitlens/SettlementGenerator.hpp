#pragma once

#include <map>
#include <string>
#include <vector>

#include "splitlens/Models.hpp"
#include "splitlens/SplitConfig.hpp"

namespace splitlens {

// Everyone other than the payer owes the payer their adjusted total. Debts at or below
// cfg.min_settlement_cents are dropped. Sorted by amount desc, then debtor id.
std::vector<Settlement> generate_settlements(
    const Session& session,
    const std::map<std::string, Cents>& adjusted,
    const SplitConfig& cfg = {}
);

// One line per item the participant shares, e.g.
//   "Steak: $30.00"
//   "Beer (×3): $15.00"
//   "Pizza: $24.00 ÷ 3 = $8.00"
// or "Your share of the bill" when the participant shares no item.
std::string explain_share(const Session& session, const std::string& participant);

}  // namespace splitlens
