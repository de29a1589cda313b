#pragma once

#include "splitlens/Money.hpp"

namespace splitlens {

struct SplitConfig {
    // |allocated - entered| / entered * 100
    double variance_warning_percent = 1.0;    // warn above this
    double variance_error_percent = 10.0;     // fail above this

    // debts at or below this are dropped as noise
    Cents min_settlement_cents = 1;

    // structural check only (check_session)
    int min_participants = 2;
    Cents discrepancy_tolerance_cents = 5;
};

}  // namespace splitlens
