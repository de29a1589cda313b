#include "commands/split.hpp"

#include "io/JsonIO.hpp"
#include "splitlens/BillSplitEngine.hpp"
#include "splitlens/BillSplitError.hpp"
#include "splitlens/SplitArtifact.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number for " + key + ": " + s);
    }
}

static int split_usage() {
    std::cerr
        << "usage:\n"
        << "  splitlens split --session <path> [--outdir <dir>] [--config <path>]\n"
        << "                  [--warn_pct <f>] [--error_pct <f>] [--min_settlement <amount>]\n";
    return 1;
}

int cmd_split(int argc, char** argv) {
    const std::string session_path = get_arg(argc, argv, "--session", "");
    if (session_path.empty()) {
        std::cerr << "error: missing --session\n";
        return split_usage();
    }

    try {
        const fs::path outdir = get_arg(argc, argv, "--outdir", "out");
        const std::string config_path = get_arg(argc, argv, "--config", "");

        splitlens::SplitConfig cfg;
        if (!config_path.empty()) cfg = loadSplitConfig(config_path, cfg);

        cfg.variance_warning_percent = get_arg_double(argc, argv, "--warn_pct", cfg.variance_warning_percent);
        cfg.variance_error_percent = get_arg_double(argc, argv, "--error_pct", cfg.variance_error_percent);

        const std::string min_settlement = get_arg(argc, argv, "--min_settlement", "");
        if (!min_settlement.empty()) cfg.min_settlement_cents = splitlens::parse_amount(min_settlement);

        splitlens::SplitArtifact artifact;
        artifact.session_path = session_path;
        artifact.session = loadSession(session_path);
        artifact.cfg = cfg;
        artifact.result = splitlens::compute_splits(artifact.session, cfg);

        const fs::path out_path = outdir / "settlements.json";
        artifact.write_to(out_path);

        const auto& res = artifact.result;

        std::cout << "SESSION: " << session_path << "\n";
        std::cout << "PAID_BY: " << artifact.session.payer << "\n";
        std::cout << "TOTAL: " << splitlens::format_currency(artifact.session.entered_total) << "\n";
        std::cout << "ALLOCATED: " << splitlens::format_currency(res.allocated_total) << "\n";
        std::cout << "OUT_SETTLEMENTS: " << out_path.string() << "\n";
        std::cout << "SETTLEMENTS: " << res.settlements.size() << "\n";

        for (const auto& s : res.settlements) std::cout << "  " << s.summary() << "\n";
        for (const auto& w : res.warnings) std::cout << "WARNING: " << w.message() << "\n";

        return 0;
    } catch (const splitlens::BillSplitError& e) {
        std::cerr << "split failed: " << e.what() << " [" << splitlens::error_kind_str(e.kind()) << "]\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "split failed: " << e.what() << "\n";
        return 1;
    }
}
