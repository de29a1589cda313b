#include "commands/validate.hpp"

#include "io/JsonIO.hpp"
#include "splitlens/Validator.hpp"

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

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  splitlens validate --session <path> [--config <path>] [--out <path>]\n";
    return 1;
}

int cmd_validate(int argc, char** argv) {
    const std::string session_path = get_arg(argc, argv, "--session", "");
    if (session_path.empty()) {
        std::cerr << "error: missing --session\n";
        return validate_usage();
    }

    const std::string out_path = get_arg(argc, argv, "--out", (fs::path("out") / "validation_report.json").string());
    const std::string config_path = get_arg(argc, argv, "--config", "");

    splitlens::ValidationReport rep;
    try {
        splitlens::SplitConfig cfg;
        if (!config_path.empty()) cfg = loadSplitConfig(config_path, cfg);

        rep = splitlens::check_session(loadSession(session_path), cfg);
        splitlens::write_validation_report(fs::path(out_path), rep);
    } catch (const std::exception& e) {
        std::cerr << "validate failed: " << e.what() << "\n";
        return 1;
    }

    if (!rep.pass) {
        std::cerr << "validation failed: wrote " << out_path << "\n";
        for (const auto& e : rep.errors) {
            std::cerr << "- " << e.code << ": " << e.message;
            if (!e.item.empty()) std::cerr << " (item=" << e.item << ")";
            std::cerr << "\n";
        }
        return 1;
    }

    std::cout << "VALIDATION: pass\n";
    std::cout << "OUT_VALIDATE: " << out_path << "\n";
    return 0;
}
