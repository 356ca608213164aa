#include <iostream>
#include <optional>
#include <string>

#include "core/check_run.h"
#include "core/errors.h"
#include "core/scan_config.h"
#include "utils/logging.h"

namespace {

struct Args {
    std::string config_path = "config.json";
    bool strict = false;
    bool help = false;
};

void print_usage(std::ostream& out) {
    out << "usage: hardlink_checker [--config <path>] [--strict]\n"
        << "  --config <path>  JSON configuration (default: config.json)\n"
        << "  --strict         exit 1 when non-hardlinked files are found\n";
}

std::optional<Args> parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string k = argv[i];
        if (k == "--config") {
            if (i + 1 >= argc) return std::nullopt;
            a.config_path = argv[++i];
        }
        else if (k == "--strict") a.strict = true;
        else if (k == "-h" || k == "--help") a.help = true;
        else return std::nullopt;
    }
    return a;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (!args.has_value()) {
        print_usage(std::cerr);
        return core::kExitConfig;
    }
    if (args->help) {
        print_usage(std::cout);
        return core::kExitOk;
    }

    utils::Logger log;

    core::ScanConfiguration cfg;
    try {
        cfg = core::load_scan_configuration(args->config_path);
    } catch (const core::ConfigurationError& e) {
        log.critical(std::string("Configuration error: ") + e.what());
        return core::kExitConfig;
    }

    log.set_level(cfg.log_level);
    if (!cfg.log_file.empty() && !log.set_log_file(cfg.log_file)) {
        std::cerr << "Failed to open log file: " << cfg.log_file << "\n";
    }

    try {
        return core::run_check(cfg, log, std::cout, args->strict);
    } catch (const std::exception& e) {
        log.critical(std::string("Unexpected error: ") + e.what());
        return core::kExitFailure;
    }
}
