#pragma once

#include <filesystem>
#include <iosfwd>

#include "scan_config.h"
#include "utils/logging.h"

namespace core {

enum ExitCode {
    kExitOk = 0,
    kExitUnlinkedFound = 1,
    kExitFailure = 1,
    kExitConfig = 2,
    kExitReportWrite = 3,
};

// Report path for this run: output_path, or its timestamped variant.
std::filesystem::path effective_report_path(const ScanConfiguration& cfg);

// Scan -> write report -> console summary. The summary is printed even when
// the report can't be written. Returns the process exit code.
int run_check(const ScanConfiguration& cfg,
              utils::Logger& log,
              std::ostream& console,
              bool strict);

} // namespace core
