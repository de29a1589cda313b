#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "splitlens/Models.hpp"
#include "splitlens/SplitConfig.hpp"

namespace splitlens {

struct PreflightResult {
    std::vector<SettlementWarning> warnings;
    bool proceed = true;   // false: single participant, nothing to settle
};

// Fail-fast structural checks run before allocation. Throws BillSplitError.
PreflightResult validate_session(const Session& session);

double variance_percent(Cents allocated, Cents entered);

// Post-allocation reconciliation check. Throws BillSplitError above the error threshold,
// appends a TotalVariance warning above the warning threshold.
void check_variance(Cents allocated, Cents entered, const SplitConfig& cfg,
                    std::vector<SettlementWarning>& warnings);

// Collect-everything counterpart used by `splitlens validate`; never throws on bad data.
struct ValidationError {
    std::string code;
    std::string message;
    std::string item;
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationError> errors;
};

ValidationReport check_session(const Session& session, const SplitConfig& cfg = {});
void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace splitlens
