#include "splitlens/BillSplitEngine.hpp"

#include "splitlens/BillSplitError.hpp"
#include "splitlens/SplitArtifact.hpp"

#include <cassert>
#include <iostream>
#include <random>
#include <set>
#include <string>

namespace {

using namespace splitlens;

LineItem MakeItem(const std::string& name, Cents amount, Assignment a, int quantity = 1) {
    LineItem item;
    item.name = name;
    item.quantity = quantity;
    item.amount = amount;
    item.assignment = std::move(a);
    return item;
}

Session MakeSession(std::vector<std::string> roster, const std::string& payer, Cents total) {
    Session s;
    s.participants = std::move(roster);
    s.payer = payer;
    s.entered_total = total;
    return s;
}

const Settlement* FindFrom(const SplitResult& r, const std::string& from) {
    for (const auto& s : r.settlements) {
        if (s.from == from) return &s;
    }
    return nullptr;
}

bool HasWarning(const SplitResult& r, WarningKind k) {
    for (const auto& w : r.warnings) {
        if (w.kind == k) return true;
    }
    return false;
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void TestEvenTwoWaySplit() {
    Session s = MakeSession({"Alice", "Bob"}, "Alice", 2000);
    s.items.push_back(MakeItem("Pizza", 2000, Assignment::subset({"Alice", "Bob"})));

    const SplitResult r = compute_splits(s);
    assert(r.settlements.size() == 1);
    assert(r.settlements[0].from == "Bob");
    assert(r.settlements[0].to == "Alice");
    assert(r.settlements[0].amount == 1000);
    assert(!r.has_warnings());
}

void TestEveryoneItemThreeWays() {
    Session s = MakeSession({"Alice", "Bob", "Carol"}, "Alice", 500);
    s.items.push_back(MakeItem("Tax", 500, Assignment::everyone()));

    const SplitResult r = compute_splits(s);
    assert(r.settlements.size() == 2);
    for (const auto& st : r.settlements) {
        assert(st.to == "Alice");
        assert(Contains(st.explanation, "÷ 3 ="));
        assert(st.amount == 166 || st.amount == 167);
    }
}

void TestEveryoneItemFourWays() {
    Session s = MakeSession({"Alice", "Bob", "Carol", "David"}, "Alice", 500);
    s.items.push_back(MakeItem("Tax", 500, Assignment::everyone()));

    const SplitResult r = compute_splits(s);
    assert(r.settlements.size() == 3);
    for (const auto& st : r.settlements) {
        assert(st.amount == 125);
        assert(st.explanation == "Tax: $5.00 ÷ 4 = $1.25");
    }
}

void TestPayerOrderedEverything() {
    Session s = MakeSession({"Alice", "Bob"}, "Alice", 4500);
    s.items.push_back(MakeItem("Steak", 3000, Assignment::subset({"Alice"})));
    s.items.push_back(MakeItem("Wine", 1500, Assignment::subset({"Alice"})));

    const SplitResult r = compute_splits(s);
    assert(r.settlements.empty());
    assert(r.person_totals.at("Bob") == 0);
    assert(r.person_totals.at("Alice") == 4500);
}

void TestQuantityHandling() {
    Session s = MakeSession({"Alice", "Bob"}, "Alice", 1500);
    s.items.push_back(MakeItem("Beer", 1500, Assignment::subset({"Bob"}), 3));

    const SplitResult r = compute_splits(s);
    assert(r.settlements.size() == 1);
    assert(r.settlements[0].amount == 1500);
    assert(r.settlements[0].explanation == "Beer (×3): $15.00");
}

void TestTenDollarsThreeWays() {
    Session s = MakeSession({"Alice", "Bob", "Carol"}, "Alice", 1000);
    s.items.push_back(MakeItem("Item", 1000, Assignment::subset({"Alice", "Bob", "Carol"})));

    const SplitResult r = compute_splits(s);
    assert(r.settlements.size() == 2);

    Cents owed = 0;
    for (const auto& st : r.settlements) owed += st.amount;
    assert(owed + r.person_totals.at("Alice") == 1000);
    assert(FindFrom(r, "Bob")->amount == 333);
    assert(FindFrom(r, "Carol")->amount == 333);
    assert(r.person_totals.at("Alice") == 334);
}

void TestSingleParticipant() {
    Session s = MakeSession({"Alice"}, "Alice", 500);
    s.items.push_back(MakeItem("Coffee", 500, Assignment::subset({"Alice"})));

    const SplitResult r = compute_splits(s);
    assert(r.settlements.empty());
    assert(HasWarning(r, WarningKind::SingleParticipant));
}

void TestTinyAmountsFiltered() {
    Session s = MakeSession({"Alice", "Bob"}, "Alice", 1);
    s.items.push_back(MakeItem("Tiny Item", to_cents(0.005), Assignment::subset({"Bob"})));

    const SplitResult r = compute_splits(s);
    assert(r.settlements.empty());
}

void TestUnassignedWarning() {
    Session s = MakeSession({"Alice", "Bob"}, "Alice", 2000);
    s.items.push_back(MakeItem("Pizza", 2000, Assignment::subset({"Alice", "Bob"})));
    s.items.push_back(MakeItem("Dessert", 800, Assignment::unassigned()));

    const SplitResult r = compute_splits(s);
    assert(HasWarning(r, WarningKind::UnassignedItems));
    assert(!HasWarning(r, WarningKind::TotalVariance));
    assert(FindFrom(r, "Bob")->amount == 1000);
}

void TestVarianceWithinTolerance() {
    Session s = MakeSession({"Alice", "Bob"}, "Alice", 10050);
    s.items.push_back(MakeItem("Item", 10000, Assignment::subset({"Alice", "Bob"})));

    const SplitResult r = compute_splits(s);
    assert(!HasWarning(r, WarningKind::TotalVariance));
}

void TestVarianceWarningStillSettlesToEnteredTotal() {
    // items $100.00, entered $110.00 -> 9.09%
    Session s = MakeSession({"Alice", "Bob"}, "Alice", 11000);
    s.items.push_back(MakeItem("Item", 10000, Assignment::subset({"Alice", "Bob"})));

    const SplitResult r = compute_splits(s);
    int variance_warnings = 0;
    for (const auto& w : r.warnings) {
        if (w.kind == WarningKind::TotalVariance) ++variance_warnings;
    }
    assert(variance_warnings == 1);
    assert(r.allocated_total == 10000);
    assert(r.person_totals.at("Alice") + r.person_totals.at("Bob") == 11000);
}

void TestVarianceBoundaries() {
    Session warn = MakeSession({"Alice", "Bob"}, "Alice", 10000);
    warn.items.push_back(MakeItem("Item", 10990, Assignment::subset({"Alice", "Bob"})));   // 9.9%
    const SplitResult r = compute_splits(warn);
    assert(HasWarning(r, WarningKind::TotalVariance));
    assert(r.settlements.size() == 1);

    Session fatal = MakeSession({"Alice", "Bob"}, "Alice", 10000);
    fatal.items.push_back(MakeItem("Item", 11010, Assignment::subset({"Alice", "Bob"})));   // 10.1%

    bool threw = false;
    try {
        compute_splits(fatal);
    } catch (const BillSplitError& e) {
        threw = true;
        assert(e.kind() == BillSplitErrorKind::TotalsDoNotMatch);
    }
    assert(threw);
}

void TestInvalidPayer() {
    Session s = MakeSession({"Alice", "Bob"}, "Dave", 1000);
    s.items.push_back(MakeItem("Item", 1000, Assignment::subset({"Alice"})));

    bool threw = false;
    try {
        compute_splits(s);
    } catch (const BillSplitError& e) {
        threw = true;
        assert(e.kind() == BillSplitErrorKind::InvalidPayer);
        assert(e.name() == "Dave");
    }
    assert(threw);
}

void TestComplexScenario() {
    Session s = MakeSession({"Alice", "Bob", "Carol"}, "Alice", 6610);
    s.items.push_back(MakeItem("Alice's Salad", 1200, Assignment::subset({"Alice"})));
    s.items.push_back(MakeItem("Bob's Burger", 1500, Assignment::subset({"Bob"})));
    s.items.push_back(MakeItem("Shared Pizza", 2400, Assignment::subset({"Alice", "Bob", "Carol"})));
    s.items.push_back(MakeItem("Tax", 510, Assignment::everyone()));
    s.items.push_back(MakeItem("Tip", 1000, Assignment::everyone()));

    const SplitResult r = compute_splits(s);
    assert(r.settlements.size() == 2);
    assert(r.settlements[0].from == "Bob" && r.settlements[0].amount == 2803);
    assert(r.settlements[1].from == "Carol" && r.settlements[1].amount == 1303);
    assert(r.person_totals.at("Alice") == 2504);

    const std::string& bob = r.settlements[0].explanation;
    assert(Contains(bob, "Bob's Burger: $15.00"));
    assert(Contains(bob, "Shared Pizza: $24.00 ÷ 3 = $8.00"));
    assert(Contains(bob, "Tip: $10.00 ÷ 3 = $3.33"));
    assert(!Contains(bob, "Alice's Salad"));
}

Session RandomSession(std::mt19937& rng) {
    std::uniform_int_distribution<int> roster_n(2, 6);
    std::uniform_int_distribution<int> item_n(1, 12);
    std::uniform_int_distribution<Cents> price(0, 9999);
    std::uniform_int_distribution<int> mode(0, 3);

    const std::vector<std::string> names = {"Dave", "alice", "Bob", "Carol", "Erin", "Frank"};

    Session s;
    const int n = roster_n(rng);
    s.participants.assign(names.begin(), names.begin() + n);
    s.payer = s.participants[std::uniform_int_distribution<int>(0, n - 1)(rng)];

    Cents sum = 0;
    const int items = item_n(rng);
    for (int i = 0; i < items; ++i) {
        LineItem item;
        item.name = "item" + std::to_string(i);
        item.quantity = 1 + (i % 3);
        item.amount = price(rng);

        const int m = mode(rng);
        if (m == 0) {
            item.assignment = Assignment::everyone();
        } else {
            std::vector<std::string> subset;
            for (const auto& p : s.participants) {
                if (std::uniform_int_distribution<int>(0, 1)(rng) == 1) subset.push_back(p);
            }
            if (subset.empty()) subset.push_back(s.participants[0]);
            item.assignment = Assignment::subset(subset);
        }
        sum += item.amount;
        s.items.push_back(item);
    }

    // stay within the 1% warning band
    s.entered_total = sum + std::uniform_int_distribution<Cents>(0, sum / 100)(rng);
    if (s.entered_total == 0) s.entered_total = 1;
    return s;
}

void TestPropertiesOnRandomSessions() {
    std::mt19937 rng(20241128);
    SplitConfig cfg;

    for (int round = 0; round < 500; ++round) {
        const Session s = RandomSession(rng);

        SplitResult r;
        try {
            r = compute_splits(s, cfg);
        } catch (const BillSplitError&) {
            // an all-zero bill with a 1 cent total is legitimately out of range
            continue;
        }

        // exact sum across every roster member
        Cents total = 0;
        for (const auto& kv : r.person_totals) total += kv.second;
        assert(total == s.entered_total);

        // settlements: never from the payer, always above the threshold, roster coverage
        std::set<std::string> debtors;
        Cents owed = 0;
        for (const auto& st : r.settlements) {
            assert(st.from != s.payer);
            assert(st.to == s.payer);
            assert(st.amount > cfg.min_settlement_cents);
            assert(st.amount == r.person_totals.at(st.from));
            assert(debtors.insert(st.from).second);
            owed += st.amount;
        }
        for (const auto& p : s.participants) {
            if (p == s.payer) continue;
            const bool significant = r.person_totals.at(p) > cfg.min_settlement_cents;
            assert(significant == (debtors.count(p) == 1));
        }

        Cents dropped = 0;
        for (const auto& p : s.participants) {
            if (p != s.payer && debtors.count(p) == 0) dropped += r.person_totals.at(p);
        }
        assert(owed + dropped + r.person_totals.at(s.payer) == s.entered_total);

        // ordering: amount desc
        for (size_t i = 1; i < r.settlements.size(); ++i) {
            assert(r.settlements[i - 1].amount >= r.settlements[i].amount);
        }

        // determinism / idempotence
        const SplitResult again = compute_splits(s, cfg);
        SplitArtifact a1;
        a1.session = s;
        a1.result = r;
        SplitArtifact a2;
        a2.session = s;
        a2.result = again;
        assert(a1.to_json().dump() == a2.to_json().dump());
    }
}

} // namespace

int main() {
    TestEvenTwoWaySplit();
    TestEveryoneItemThreeWays();
    TestEveryoneItemFourWays();
    TestPayerOrderedEverything();
    TestQuantityHandling();
    TestTenDollarsThreeWays();
    TestSingleParticipant();
    TestTinyAmountsFiltered();
    TestUnassignedWarning();
    TestVarianceWithinTolerance();
    TestVarianceWarningStillSettlesToEnteredTotal();
    TestVarianceBoundaries();
    TestInvalidPayer();
    TestComplexScenario();
    TestPropertiesOnRandomSessions();

    std::cout << "splitlens_unit_bill_split_engine: pass\n";
    return 0;
}
