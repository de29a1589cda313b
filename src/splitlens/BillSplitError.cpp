#include "splitlens/BillSplitError.hpp"

#include <cstdio>
#include <utility>

namespace splitlens {

BillSplitError::BillSplitError(BillSplitErrorKind kind, const std::string& message, std::string name)
    : std::runtime_error(message), kind_(kind), name_(std::move(name)) {}

BillSplitError BillSplitError::no_participants() {
    return BillSplitError(BillSplitErrorKind::NoParticipants, "Cannot calculate splits without participants.");
}

BillSplitError BillSplitError::no_items() {
    return BillSplitError(BillSplitErrorKind::NoItems, "Cannot calculate splits without items.");
}

BillSplitError BillSplitError::invalid_payer(const std::string& payer) {
    return BillSplitError(BillSplitErrorKind::InvalidPayer,
                          "Payer '" + payer + "' is not one of the participants.", payer);
}

BillSplitError BillSplitError::duplicate_participant(const std::string& name) {
    return BillSplitError(BillSplitErrorKind::DuplicateParticipant,
                          "Participant '" + name + "' is listed more than once.", name);
}

BillSplitError BillSplitError::invalid_item(const std::string& item_name, const std::string& why) {
    return BillSplitError(BillSplitErrorKind::InvalidItem,
                          "Item '" + item_name + "' is invalid: " + why, item_name);
}

BillSplitError BillSplitError::unknown_assignee(const std::string& name, const std::string& item_name) {
    return BillSplitError(BillSplitErrorKind::UnknownAssignee,
                          "Item '" + item_name + "' is assigned to '" + name + "', who is not a participant.", name);
}

BillSplitError BillSplitError::invalid_total(Cents entered) {
    BillSplitError e(BillSplitErrorKind::InvalidTotal,
                     "Total amount must be greater than 0 (got " + format_currency(entered) + ").");
    e.expected_ = entered;
    return e;
}

BillSplitError BillSplitError::totals_do_not_match(Cents allocated, Cents expected, double variance_percent) {
    char pct[32];
    std::snprintf(pct, sizeof(pct), "%.2f", variance_percent);

    BillSplitError e(BillSplitErrorKind::TotalsDoNotMatch,
                     "Item totals do not match the entered total: calculated " + format_currency(allocated) +
                         " vs entered " + format_currency(expected) + " (variance " + pct + "%).");
    e.allocated_ = allocated;
    e.expected_ = expected;
    e.variance_percent_ = variance_percent;
    return e;
}

const char* error_kind_str(BillSplitErrorKind k) {
    switch (k) {
        case BillSplitErrorKind::NoParticipants: return "no_participants";
        case BillSplitErrorKind::NoItems: return "no_items";
        case BillSplitErrorKind::InvalidPayer: return "invalid_payer";
        case BillSplitErrorKind::DuplicateParticipant: return "duplicate_participant";
        case BillSplitErrorKind::InvalidItem: return "invalid_item";
        case BillSplitErrorKind::UnknownAssignee: return "unknown_assignee";
        case BillSplitErrorKind::InvalidTotal: return "invalid_total";
        case BillSplitErrorKind::TotalsDoNotMatch: return "totals_do_not_match";
        default: return "unknown";
    }
}

}  // namespace splitlens
