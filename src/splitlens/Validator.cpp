#include "splitlens/Validator.hpp"

#include "nlohmann/json.hpp"
#include "splitlens/BillSplitError.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace splitlens {

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); });
}

static std::string item_label(const LineItem& item, size_t index) {
    if (!is_blank(item.name)) return item.name;
    return "item #" + std::to_string(index + 1);
}

PreflightResult validate_session(const Session& session) {
    PreflightResult res;

    if (session.participants.empty()) throw BillSplitError::no_participants();
    if (session.items.empty()) throw BillSplitError::no_items();

    const auto& roster = session.participants;
    if (std::find(roster.begin(), roster.end(), session.payer) == roster.end()) {
        throw BillSplitError::invalid_payer(session.payer);
    }

    std::unordered_set<std::string> known;
    known.reserve(roster.size() * 2 + 8);
    for (const auto& p : roster) {
        if (!known.insert(p).second) throw BillSplitError::duplicate_participant(p);
    }

    int unassigned = 0;
    for (size_t i = 0; i < session.items.size(); ++i) {
        const LineItem& item = session.items[i];

        if (item.quantity < 1) throw BillSplitError::invalid_item(item_label(item, i), "quantity must be at least 1");
        if (item.amount < 0) throw BillSplitError::invalid_item(item_label(item, i), "amount cannot be negative");

        if (item.assignment.kind == AssignmentKind::Subset) {
            for (const auto& m : item.assignment.members) {
                if (known.find(m) == known.end()) throw BillSplitError::unknown_assignee(m, item_label(item, i));
            }
        }

        if (!item.assignment.is_assigned()) ++unassigned;
    }

    if (unassigned > 0) {
        SettlementWarning w;
        w.kind = WarningKind::UnassignedItems;
        w.count = unassigned;
        res.warnings.push_back(w);
    }

    if (roster.size() == 1) {
        SettlementWarning w;
        w.kind = WarningKind::SingleParticipant;
        res.warnings.push_back(w);
        res.proceed = false;
    }

    return res;
}

double variance_percent(Cents allocated, Cents entered) {
    const Cents diff = allocated > entered ? allocated - entered : entered - allocated;
    return static_cast<double>(diff) * 100.0 / static_cast<double>(entered);
}

void check_variance(Cents allocated, Cents entered, const SplitConfig& cfg,
                    std::vector<SettlementWarning>& warnings) {
    if (entered <= 0) throw BillSplitError::invalid_total(entered);

    const double pct = variance_percent(allocated, entered);

    if (pct > cfg.variance_error_percent) {
        throw BillSplitError::totals_do_not_match(allocated, entered, pct);
    }

    if (pct > cfg.variance_warning_percent) {
        SettlementWarning w;
        w.kind = WarningKind::TotalVariance;
        w.allocated = allocated;
        w.expected = entered;
        w.variance_percent = pct;
        warnings.push_back(w);
    }
}

static void add_error(ValidationReport& rep, const std::string& code, const std::string& msg, const std::string& item = "") {
    rep.pass = false;
    ValidationError e;
    e.code = code;
    e.message = msg;
    e.item = item;
    rep.errors.push_back(std::move(e));
}

ValidationReport check_session(const Session& session, const SplitConfig& cfg) {
    ValidationReport rep;

    const auto& roster = session.participants;

    if (roster.empty()) {
        add_error(rep, "no_participants", "No participants added");
    } else if (static_cast<int>(roster.size()) < cfg.min_participants) {
        add_error(rep, "too_few_participants", "Need at least " + std::to_string(cfg.min_participants) + " participants");
    }

    std::unordered_set<std::string> known;
    for (const auto& p : roster) {
        if (!known.insert(p).second) add_error(rep, "duplicate_participant", "Participant listed more than once: " + p);
    }

    if (is_blank(session.payer)) {
        add_error(rep, "no_payer", "No payer selected");
    } else if (known.find(session.payer) == known.end()) {
        add_error(rep, "invalid_payer", "Payer must be a participant: " + session.payer);
    }

    if (session.items.empty()) add_error(rep, "no_items", "No items added");

    int unassigned = 0;
    Cents item_sum = 0;
    for (size_t i = 0; i < session.items.size(); ++i) {
        const LineItem& item = session.items[i];
        const std::string label = item_label(item, i);
        item_sum += item.amount;

        if (is_blank(item.name)) add_error(rep, "invalid_item", "Item name cannot be empty", label);
        if (item.quantity < 1) add_error(rep, "invalid_item", "Quantity must be greater than 0", label);
        if (item.amount < 0) add_error(rep, "invalid_item", "Price cannot be negative", label);

        if (item.assignment.kind == AssignmentKind::Subset) {
            for (const auto& m : item.assignment.members) {
                if (known.find(m) == known.end()) add_error(rep, "unknown_assignee", "Assigned to non-participant: " + m, label);
            }
        }

        if (!item.assignment.is_assigned()) ++unassigned;
    }

    if (session.entered_total <= 0) add_error(rep, "invalid_total", "Total amount must be greater than 0");

    if (unassigned > 0) add_error(rep, "unassigned_items", std::to_string(unassigned) + " item(s) not assigned");

    if (!session.items.empty() && session.entered_total > 0) {
        const Cents discrepancy = session.entered_total - item_sum;
        const Cents mag = discrepancy < 0 ? -discrepancy : discrepancy;
        if (mag > cfg.discrepancy_tolerance_cents) {
            add_error(rep, "total_discrepancy",
                      "Items sum to " + format_currency(item_sum) + " but the entered total is " +
                          format_currency(session.entered_total));
        }
    }

    return rep;
}

void write_validation_report(const fs::path& path, const ValidationReport& rep) {
    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    nlohmann::json j;
    j["pass"] = rep.pass;
    j["errors"] = nlohmann::json::array();

    for (const auto& e : rep.errors) {
        nlohmann::json ej;
        ej["code"] = e.code;
        ej["message"] = e.message;
        if (!e.item.empty()) ej["item"] = e.item;
        j["errors"].push_back(ej);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open output file: " + path.string());
    out << j.dump(2) << "\n";
}

}  // namespace splitlens
