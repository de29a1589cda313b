#include "commands/split.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  splitlens split [args]\n"
        << "  splitlens validate [args]\n"
        << "  splitlens help\n";
    return 1;
}

static int print_split_help() {
    std::cerr
        << "usage:\n"
        << "  splitlens split --session <path> [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --session <path>             (required) session JSON\n"
        << "  --outdir <dir>               default: out\n"
        << "  --config <path>              optional split_config JSON\n"
        << "\n"
        << "thresholds (override --config):\n"
        << "  --warn_pct <f>               default: 1.0\n"
        << "  --error_pct <f>              default: 10.0\n"
        << "  --min_settlement <amount>    default: 0.01\n";
    return 0;
}

static int print_validate_help() {
    std::cerr
        << "usage:\n"
        << "  splitlens validate --session <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --config <path>              optional split_config JSON\n"
        << "  --out <path>                 default: out/validation_report.json\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "split"    && (argc >= 3 && std::string(argv[2]) == "--help")) return print_split_help();
    if (cmd == "validate" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_validate_help();

    if (cmd == "split")    return cmd_split(argc - 1, argv + 1);
    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
