#include "report_writer.h"

#include <fstream>
#include <ostream>
#include <system_error>
#include <vector>

#include "errors.h"
#include "utils/format_utils.h"
#include "utils/time_utils.h"

namespace core {

namespace fs = std::filesystem;

namespace {

const std::string kRule(80, '=');
const std::string kThinRule(80, '-');

void banner(std::ostream& out, const char* title) {
    out << kRule << "\n" << title << "\n" << kRule << "\n\n";
}

void write_entries(std::ostream& out, const std::vector<FileRecord>& files) {
    std::size_t i = 0;
    for (const auto& f : files) {
        out << "[" << ++i << "] " << f.path << "\n"
            << "    Size:         " << utils::human_readable_size(f.size_bytes)
            << " (" << f.size_bytes << " bytes)\n"
            << "    Link Count:   " << f.link_count << "\n"
            << "    Inode:        " << f.inode << "\n"
            << "    Modified:     " << utils::format_seconds_local(f.modified_time) << "\n"
            << "\n";
    }
}

} // namespace

void render_report(std::ostream& out, const ScanResult& result) {
    const ScanSummary& s = result.summary;

    banner(out, "HARDLINK CHECK REPORT");

    out << "SUMMARY STATISTICS\n"
        << kThinRule << "\n"
        << "Scan Path:                 " << s.scan_path << "\n"
        << "Scan Timestamp:            " << s.scan_timestamp << "\n"
        << "Total Files Scanned:       " << s.total_files_scanned << "\n"
        << "Hardlinked Files:          " << s.hardlinked_count << "\n"
        << "Non-Hardlinked Files:      " << s.non_hardlinked_count << "\n"
        << "Errors Encountered:        " << s.errors_encountered << "\n"
        << "Total Size:                " << utils::human_readable_size(s.total_size) << "\n"
        << "Non-Hardlinked Size:       " << utils::human_readable_size(s.total_size_non_hardlinked)
        << " (" << s.total_size_non_hardlinked << " bytes)\n"
        << "Percentage Not Hardlinked: "
        << utils::format_percentage(s.non_hardlinked_count, s.total_files_scanned) << "%\n"
        << "\n";

    if (result.non_hardlinked.empty()) {
        out << kRule << "\n"
            << "All files are properly hardlinked!\n"
            << kRule << "\n";
    } else {
        banner(out, "NON-HARDLINKED FILES");
        write_entries(out, result.non_hardlinked);
    }

    if (!result.hardlinked.empty()) {
        out << "\n";
        banner(out, "HARDLINKED FILES");
        write_entries(out, result.hardlinked);
    }
}

void write_report(const fs::path& path, const ScanResult& result) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw ReportWriteError(path.string(), "cannot create directory " +
                                       path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw ReportWriteError(path.string(), "cannot open file for writing");
    }

    render_report(out, result);
    out.flush();
    if (!out) {
        throw ReportWriteError(path.string(), "write failed");
    }
}

void print_console_summary(std::ostream& out,
                           const ScanSummary& s,
                           const std::optional<std::string>& saved_to,
                           const std::string& failure_reason) {
    out << "\n" << kRule << "\n"
        << "SCAN COMPLETE\n"
        << kRule << "\n"
        << "Total files scanned:      " << s.total_files_scanned << "\n"
        << "Hardlinked files:         " << s.hardlinked_count << "\n"
        << "Non-hardlinked files:     " << s.non_hardlinked_count << "\n"
        << "Non-hardlinked size:      " << utils::human_readable_size(s.total_size_non_hardlinked) << "\n"
        << "Errors encountered:       " << s.errors_encountered << "\n";
    if (saved_to.has_value()) {
        out << "Report saved to:          " << *saved_to << "\n";
    } else {
        out << "Report NOT saved:         " << failure_reason << "\n";
    }
    out << kRule << "\n\n";
    out.flush();
}

fs::path timestamped_output_path(const fs::path& base, const std::string& stamp) {
    std::string name = base.stem().string() + "_" + stamp + base.extension().string();
    return base.parent_path() / name;
}

} // namespace core
