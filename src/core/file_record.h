#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/time_utils.h"

namespace core {

struct FileRecord {
    std::string path;
    std::uintmax_t size_bytes = 0;
    std::uintmax_t link_count = 0;
    std::uintmax_t inode = 0;
    utils::SystemClock::time_point modified_time{};

    bool is_hardlinked() const { return link_count > 1; }
};

struct ScanSummary {
    std::string scan_path;
    std::string scan_timestamp;

    std::size_t total_files_scanned = 0;
    std::size_t hardlinked_count = 0;
    std::size_t non_hardlinked_count = 0;
    std::size_t errors_encountered = 0;
    std::size_t skipped_entries = 0;    // symlinks and special files, not counted in total

    std::uintmax_t total_size = 0;
    std::uintmax_t total_size_non_hardlinked = 0;

    long long elapsed_ms = 0;

    // hardlinked + non_hardlinked + errors == total
    bool balanced() const {
        return hardlinked_count + non_hardlinked_count + errors_encountered == total_files_scanned;
    }
};

struct ScanResult {
    ScanSummary summary;
    std::vector<FileRecord> non_hardlinked;
    // Only filled when hardlinked details were requested
    std::vector<FileRecord> hardlinked;
};

} // namespace core
