#include "hardlink_scanner.h"

#include "errors.h"
#include "utils/format_utils.h"
#include "utils/time_utils.h"

namespace core {

namespace fs = std::filesystem;

HardlinkScanner::HardlinkScanner(utils::Logger& log, ScanOptions opts)
    : log_(log), opts_(opts) {}

void HardlinkScanner::count_error_(ScanSummary& s, const std::string& path, const std::error_code& ec) const {
    s.total_files_scanned++;
    s.errors_encountered++;
    log_.warning("Error processing " + path + ": " + ec.message());
    progress_(s);
}

void HardlinkScanner::progress_(const ScanSummary& s) const {
    if (opts_.progress_interval == 0) return;
    if (s.total_files_scanned % opts_.progress_interval != 0) return;
    log_.info("Processed " + std::to_string(s.total_files_scanned) + " files...");
}

void HardlinkScanner::add_entry(ScanResult& r, const WalkEntry& entry) const {
    ScanSummary& s = r.summary;
    const std::string path = entry.path.string();

    switch (entry.kind) {
        case EntryKind::Symlink:
        case EntryKind::Other:
            s.skipped_entries++;
            log_.debug(std::string("Skipping ") + entry_kind_name(entry.kind) + ": " + path);
            return;
        case EntryKind::Error:
            count_error_(s, path, entry.error);
            return;
        case EntryKind::Regular:
            break;
    }

    ClassifiedFile c = classifier_.classify(path);
    switch (c.kind) {
        case Classification::Skipped:
            s.skipped_entries++;
            log_.debug("No longer a regular file, skipping: " + path);
            return;
        case Classification::Error:
            count_error_(s, path, c.error);
            return;
        case Classification::NonHardlinked:
            s.non_hardlinked_count++;
            s.total_size_non_hardlinked += c.record->size_bytes;
            s.total_size += c.record->size_bytes;
            r.non_hardlinked.push_back(std::move(*c.record));
            break;
        case Classification::Hardlinked:
            s.hardlinked_count++;
            s.total_size += c.record->size_bytes;
            if (opts_.report_hardlinked) r.hardlinked.push_back(std::move(*c.record));
            break;
    }

    s.total_files_scanned++;
    progress_(s);
}

ScanResult HardlinkScanner::scan(const fs::path& root) const {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        throw ConfigurationError("Scan path does not exist: " + root.string());
    }
    if (!fs::is_directory(root, ec)) {
        throw ConfigurationError("Scan path is not a directory: " + root.string());
    }

    ScanResult r;
    ScanSummary& s = r.summary;
    s.scan_path = root.string();
    s.scan_timestamp = utils::format_seconds_local(utils::now_system());

    log_.info("Starting scan of: " + s.scan_path);
    utils::Stopwatch sw;

    DirectoryWalker walker(root);
    while (auto entry = walker.next()) {
        add_entry(r, *entry);
    }

    s.elapsed_ms = sw.elapsed_ms();

    log_.info(
        "Scan complete. Processed " + std::to_string(s.total_files_scanned) + " files:" +
        " hardlinked=" + std::to_string(s.hardlinked_count) +
        " non_hardlinked=" + std::to_string(s.non_hardlinked_count) +
        " (" + utils::human_readable_size(s.total_size_non_hardlinked) + ")" +
        " errors=" + std::to_string(s.errors_encountered) +
        " skipped=" + std::to_string(s.skipped_entries) +
        " dirs=" + std::to_string(walker.directories_visited()) +
        " t_ms=" + std::to_string(s.elapsed_ms)
    );

    return r;
}

} // namespace core
