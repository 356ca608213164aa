#include "check_run.h"

#include <optional>
#include <ostream>
#include <string>

#include "errors.h"
#include "hardlink_scanner.h"
#include "report_writer.h"
#include "utils/time_utils.h"

namespace core {

std::filesystem::path effective_report_path(const ScanConfiguration& cfg) {
    if (!cfg.timestamp_output) return cfg.output_path;
    return timestamped_output_path(cfg.output_path, utils::format_file_stamp(utils::now_system()));
}

int run_check(const ScanConfiguration& cfg,
              utils::Logger& log,
              std::ostream& console,
              bool strict) {
    const auto report_path = effective_report_path(cfg);

    ScanResult result;
    try {
        HardlinkScanner scanner(log, cfg.scan_options());
        result = scanner.scan(cfg.folder_path);
    } catch (const ConfigurationError& e) {
        log.critical(std::string("Configuration error: ") + e.what());
        return kExitConfig;
    }

    try {
        write_report(report_path, result);
        log.info("Report generated: " + report_path.string());
    } catch (const ReportWriteError& e) {
        log.error(e.what());
        print_console_summary(console, result.summary, std::nullopt, e.what());
        return kExitReportWrite;
    }

    print_console_summary(console, result.summary, report_path.string());

    if (strict && result.summary.non_hardlinked_count > 0) {
        return kExitUnlinkedFound;
    }
    return kExitOk;
}

} // namespace core
