#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

#include "file_record.h"

namespace core {

// Full text report: summary block, non-hardlinked detail list and, when
// present, the hardlinked detail list.
void render_report(std::ostream& out, const ScanResult& result);

// Writes the report to path, creating parent directories and replacing any
// existing file. Throws ReportWriteError.
void write_report(const std::filesystem::path& path, const ScanResult& result);

// Console summary. saved_to is the report path, or nullopt with
// failure_reason set when the report couldn't be written.
void print_console_summary(std::ostream& out,
                           const ScanSummary& summary,
                           const std::optional<std::string>& saved_to,
                           const std::string& failure_reason = "");

// <dir>/<stem>_<stamp><ext>
std::filesystem::path timestamped_output_path(const std::filesystem::path& base,
                                              const std::string& stamp);

} // namespace core
