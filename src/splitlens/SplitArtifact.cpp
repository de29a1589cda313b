#include "splitlens/SplitArtifact.hpp"

#include <fstream>
#include <stdexcept>

namespace splitlens {

nlohmann::json settlement_to_json(const Settlement& s) {
    return {
        {"from", s.from},
        {"to", s.to},
        {"amount", to_dollars(s.amount)},
        {"amount_cents", s.amount},
        {"summary", s.summary()},
        {"explanation", s.explanation}
    };
}

nlohmann::json warning_to_json(const SettlementWarning& w) {
    nlohmann::json j;
    j["kind"] = warning_kind_str(w.kind);
    j["message"] = w.message();

    switch (w.kind) {
        case WarningKind::TotalVariance:
            j["allocated"] = to_dollars(w.allocated);
            j["expected"] = to_dollars(w.expected);
            j["variance_percent"] = w.variance_percent;
            break;
        case WarningKind::UnassignedItems:
            j["count"] = w.count;
            break;
        default:
            break;
    }
    return j;
}

nlohmann::json split_config_to_json(const SplitConfig& cfg) {
    return {
        {"variance_warning_percent", cfg.variance_warning_percent},
        {"variance_error_percent", cfg.variance_error_percent},
        {"min_settlement", to_dollars(cfg.min_settlement_cents)},
        {"min_participants", cfg.min_participants},
        {"discrepancy_tolerance", to_dollars(cfg.discrepancy_tolerance_cents)}
    };
}

nlohmann::json SplitArtifact::to_json() const {
    nlohmann::json j;

    j["session_path"] = session_path;
    j["participants"] = session.participants;
    j["paid_by"] = session.payer;
    j["total_amount"] = to_dollars(session.entered_total);
    j["num_items"] = session.items.size();

    j["split_config"] = split_config_to_json(cfg);

    j["allocated_total"] = to_dollars(result.allocated_total);

    nlohmann::json totals = nlohmann::json::object();
    for (const auto& kv : result.person_totals) totals[kv.first] = to_dollars(kv.second);
    j["person_totals"] = totals;

    nlohmann::json settlements = nlohmann::json::array();
    for (const auto& s : result.settlements) settlements.push_back(settlement_to_json(s));
    j["settlements"] = settlements;

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& w : result.warnings) warnings.push_back(warning_to_json(w));
    j["warnings"] = warnings;

    return j;
}

void SplitArtifact::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace splitlens
