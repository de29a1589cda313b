#pragma once

#include <map>
#include <string>
#include <vector>

#include "splitlens/Money.hpp"

namespace splitlens {

// Rounds each allocation to whole cents, then hands out the remaining +/- cents one at a
// time, round-robin over the participants in lexicographic order, so that the result sums
// to exactly target_total.
std::map<std::string, Cents> reconcile_cents(
    const std::map<std::string, double>& person_cents,
    const std::vector<std::string>& participants,
    Cents target_total
);

}  // namespace splitlens
