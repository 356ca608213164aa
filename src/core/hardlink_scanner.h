#pragma once

#include <cstddef>
#include <filesystem>

#include "directory_walker.h"
#include "file_classifier.h"
#include "file_record.h"
#include "utils/logging.h"

namespace core {

struct ScanOptions {
    bool report_hardlinked = false;
    std::size_t progress_interval = 1000; // 0 = no progress lines
};

// Walks a tree, classifies every regular file by link count and
// accumulates a ScanSummary. Sequential; one scan() per walk.
class HardlinkScanner {
public:
    HardlinkScanner(utils::Logger& log, ScanOptions opts = {});

    // Throws ConfigurationError if root is not an existing directory.
    // Per-entry failures are counted, never thrown.
    ScanResult scan(const std::filesystem::path& root) const;

    // One step of scan(): classify a walker entry into r.
    void add_entry(ScanResult& r, const WalkEntry& entry) const;

private:
    utils::Logger& log_;
    ScanOptions opts_;
    FileClassifier classifier_;

    void count_error_(ScanSummary& s, const std::string& path, const std::error_code& ec) const;
    void progress_(const ScanSummary& s) const;
};

} // namespace core
