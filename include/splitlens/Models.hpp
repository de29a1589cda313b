#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "splitlens/Money.hpp"

namespace splitlens {

enum class AssignmentKind {
    Unassigned,
    Everyone,   // every roster member, whoever is listed
    Subset
};

struct Assignment {
    AssignmentKind kind = AssignmentKind::Unassigned;
    std::vector<std::string> members;   // Subset only; unique, input order

    static Assignment unassigned();
    static Assignment everyone();
    static Assignment subset(const std::vector<std::string>& ids);   // empty list -> Unassigned

    bool is_assigned() const;
    bool includes(const std::string& participant) const;   // Everyone includes all
    size_t sharing_count(size_t roster_size) const;
};

struct LineItem {
    std::string name;
    int quantity = 1;
    Cents amount = 0;                // line total as printed, not unit price
    Assignment assignment;
};

struct Session {
    std::vector<std::string> participants;
    std::string payer;
    Cents entered_total = 0;
    std::vector<LineItem> items;
};

enum class WarningKind {
    TotalVariance,
    UnassignedItems,
    SingleParticipant
};

struct SettlementWarning {
    WarningKind kind = WarningKind::SingleParticipant;

    // TotalVariance
    Cents allocated = 0;
    Cents expected = 0;
    double variance_percent = 0.0;

    // UnassignedItems
    int count = 0;

    std::string message() const;
};

struct Settlement {
    std::string from;
    std::string to;
    Cents amount = 0;
    std::string explanation;

    std::string summary() const;                // "Bob → Alice: $12.50"
    std::string detailed_description() const;   // summary + explanation
};

struct SplitResult {
    std::vector<Settlement> settlements;
    std::vector<SettlementWarning> warnings;

    // Diagnostics: adjusted cents per roster member, and the exact sum of distributed items.
    std::map<std::string, Cents> person_totals;
    Cents allocated_total = 0;

    bool has_warnings() const { return !warnings.empty(); }
};

const char* warning_kind_str(WarningKind k);
const char* assignment_kind_str(AssignmentKind k);

}  // namespace splitlens
