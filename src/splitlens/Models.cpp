#include "splitlens/Models.hpp"

#include <algorithm>
#include <cstdio>

namespace splitlens {

Assignment Assignment::unassigned() {
    return Assignment{};
}

Assignment Assignment::everyone() {
    Assignment a;
    a.kind = AssignmentKind::Everyone;
    return a;
}

Assignment Assignment::subset(const std::vector<std::string>& ids) {
    Assignment a;
    for (const auto& id : ids) {
        if (std::find(a.members.begin(), a.members.end(), id) == a.members.end()) {
            a.members.push_back(id);
        }
    }
    a.kind = a.members.empty() ? AssignmentKind::Unassigned : AssignmentKind::Subset;
    return a;
}

bool Assignment::is_assigned() const {
    return kind != AssignmentKind::Unassigned;
}

bool Assignment::includes(const std::string& participant) const {
    switch (kind) {
        case AssignmentKind::Everyone: return true;
        case AssignmentKind::Subset:
            return std::find(members.begin(), members.end(), participant) != members.end();
        default: return false;
    }
}

size_t Assignment::sharing_count(size_t roster_size) const {
    switch (kind) {
        case AssignmentKind::Everyone: return roster_size;
        case AssignmentKind::Subset: return members.size();
        default: return 0;
    }
}

std::string SettlementWarning::message() const {
    switch (kind) {
        case WarningKind::TotalVariance: {
            char pct[32];
            std::snprintf(pct, sizeof(pct), "%.2f", variance_percent);
            return "Total mismatch: Calculated " + format_currency(allocated) +
                   " vs Entered " + format_currency(expected) +
                   " (Variance: " + pct + "%). Please verify manually.";
        }
        case WarningKind::UnassignedItems:
            return std::to_string(count) + " item(s) not assigned to any participant";
        case WarningKind::SingleParticipant:
            return "Only one participant - no splits necessary";
    }
    return "";
}

std::string Settlement::summary() const {
    return from + " → " + to + ": " + format_currency(amount);
}

std::string Settlement::detailed_description() const {
    if (explanation.empty()) return summary();
    return summary() + "\n" + explanation;
}

const char* warning_kind_str(WarningKind k) {
    switch (k) {
        case WarningKind::TotalVariance: return "total_variance";
        case WarningKind::UnassignedItems: return "unassigned_items";
        case WarningKind::SingleParticipant: return "single_participant";
        default: return "unknown";
    }
}

const char* assignment_kind_str(AssignmentKind k) {
    switch (k) {
        case AssignmentKind::Unassigned: return "unassigned";
        case AssignmentKind::Everyone: return "everyone";
        case AssignmentKind::Subset: return "subset";
        default: return "unknown";
    }
}

}  // namespace splitlens
