#pragma once

#include <map>
#include <string>

#include "splitlens/Models.hpp"

namespace splitlens {

struct Allocation {
    // Fractional cents credited to each roster member (every member present, 0 if untouched).
    std::map<std::string, double> person_cents;

    // Exact sum of the amounts of every item that was distributed.
    Cents allocated_total = 0;
};

Allocation allocate(const Session& session);

}  // namespace splitlens
