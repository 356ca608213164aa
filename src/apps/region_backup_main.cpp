#include <iostream>
#include <string>
#include <utility>

#include "backup/region_backup.h"
#include "utils/logging.h"
#include "utils/time_utils.h"

namespace {

struct Args {
    std::string config_path = "region_backup.json";
    bool help = false;
    bool bad = false;
};

Args parse_args(int argc, char** argv) {
    Args a;
    for (int i = 1; i < argc; ++i) {
        std::string k = argv[i];
        if (k == "--config" && i + 1 < argc) a.config_path = argv[++i];
        else if (k == "-h" || k == "--help") a.help = true;
        else a.bad = true;
    }
    return a;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.help || args.bad) {
        (args.bad ? std::cerr : std::cout) << "usage: region_backup [--config <path>]\n";
        return args.bad ? 1 : 0;
    }

    utils::Logger log;

    try {
        auto plan = backup::load_backup_plan(args.config_path);
        log.set_level(plan.log_level);

        backup::RegionBackup job(std::move(plan), log);
        auto res = job.run(utils::now_system());
        return res.failed == 0 ? 0 : 1;
    } catch (const backup::BackupError& e) {
        log.error(std::string("Error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        log.critical(std::string("Unexpected error: ") + e.what());
        return 1;
    }
}
