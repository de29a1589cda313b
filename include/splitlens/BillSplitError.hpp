#pragma once

#include <stdexcept>
#include <string>

#include "splitlens/Money.hpp"

namespace splitlens {

enum class BillSplitErrorKind {
    NoParticipants,
    NoItems,
    InvalidPayer,
    DuplicateParticipant,
    InvalidItem,
    UnknownAssignee,
    InvalidTotal,
    TotalsDoNotMatch
};

// Fatal: thrown before any settlement is produced.
class BillSplitError : public std::runtime_error {
public:
    BillSplitError(BillSplitErrorKind kind, const std::string& message, std::string name = "");

    static BillSplitError no_participants();
    static BillSplitError no_items();
    static BillSplitError invalid_payer(const std::string& payer);
    static BillSplitError duplicate_participant(const std::string& name);
    static BillSplitError invalid_item(const std::string& item_name, const std::string& why);
    static BillSplitError unknown_assignee(const std::string& name, const std::string& item_name);
    static BillSplitError invalid_total(Cents entered);
    static BillSplitError totals_do_not_match(Cents allocated, Cents expected, double variance_percent);

    BillSplitErrorKind kind() const { return kind_; }
    const std::string& name() const { return name_; }

    Cents allocated() const { return allocated_; }
    Cents expected() const { return expected_; }
    double variance_percent() const { return variance_percent_; }

private:
    BillSplitErrorKind kind_;
    std::string name_;
    Cents allocated_ = 0;
    Cents expected_ = 0;
    double variance_percent_ = 0.0;
};

const char* error_kind_str(BillSplitErrorKind k);

}  // namespace splitlens
