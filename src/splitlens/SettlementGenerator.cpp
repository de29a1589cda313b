#include "splitlens/SettlementGenerator.hpp"

#include <algorithm>

namespace splitlens {

static std::string item_line(const LineItem& item, size_t n) {
    std::string line = item.name;
    if (item.quantity > 1) line += " (×" + std::to_string(item.quantity) + ")";
    line += ": " + format_currency(item.amount);

    if (n > 1) {
        const Cents share = divide_rounded(item.amount, static_cast<std::int64_t>(n));
        line += " ÷ " + std::to_string(n) + " = " + format_currency(share);
    }
    return line;
}

std::string explain_share(const Session& session, const std::string& participant) {
    std::string out;

    for (const auto& item : session.items) {
        if (!item.assignment.includes(participant)) continue;

        const size_t n = item.assignment.sharing_count(session.participants.size());
        if (n == 0) continue;

        if (!out.empty()) out += "\n";
        out += item_line(item, n);
    }

    if (out.empty()) return "Your share of the bill";
    return out;
}

std::vector<Settlement> generate_settlements(
    const Session& session,
    const std::map<std::string, Cents>& adjusted,
    const SplitConfig& cfg
) {
    std::vector<Settlement> out;

    for (const auto& p : session.participants) {
        if (p == session.payer) continue;

        auto it = adjusted.find(p);
        const Cents owed = (it != adjusted.end()) ? it->second : 0;
        if (owed <= cfg.min_settlement_cents) continue;

        Settlement s;
        s.from = p;
        s.to = session.payer;
        s.amount = owed;
        s.explanation = explain_share(session, p);
        out.push_back(std::move(s));
    }

    std::sort(out.begin(), out.end(),
              [](const Settlement& a, const Settlement& b) {
                  if (a.amount != b.amount) return a.amount > b.amount;
                  return a.from < b.from;
              });

    return out;
}

}  // namespace splitlens
