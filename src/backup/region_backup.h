#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "utils/config.h"
#include "utils/logging.h"
#include "utils/time_utils.h"

namespace backup {

// Bad configuration or a missing/uncreatable root directory.
class BackupError : public std::runtime_error {
public:
    explicit BackupError(const std::string& what) : std::runtime_error(what) {}
};

struct BackupPlan {
    std::filesystem::path source_dir;
    std::filesystem::path watch_dir;
    std::vector<std::string> files;      // names relative to source_dir
    int retention_days = 180;
    utils::LogLevel log_level = utils::LogLevel::Info;
};

inline constexpr const char* kBackupEnvPrefix = "RB_";

// Throws BackupError naming the key at fault.
BackupPlan backup_plan_from(const utils::Config& cfg);
BackupPlan load_backup_plan(const std::string& path);

struct BackupResult {
    std::string stamp;                   // YYYY-MM-DD_HH-MM-SS
    std::filesystem::path dest_dir;      // <watch_dir>/<stamp>
    std::size_t copied = 0;
    std::size_t missing = 0;
    std::size_t failed = 0;
    std::size_t pruned = 0;
};

// "r.2.-6.mca" -> {"r.2.-6", "mca"}; "notes" -> {"notes", ""}
std::pair<std::string, std::string> split_extension(const std::string& filename);

// "r.2.-6.mca" + stamp -> "r.2.-6_<stamp>.mca"
std::string stamped_name(const std::string& filename, const std::string& stamp);

// True iff filename is exactly <base>_<YYYY-MM-DD_HH-MM-SS> optionally
// followed by ".<ext>". Other names sharing the prefix never match.
bool is_backup_copy_of(const std::string& filename, const std::string& base);

// Deletes copies of base anywhere under watch_dir whose mtime is more than
// retention_days before now. Returns how many files were removed.
std::size_t prune_expired(const std::filesystem::path& watch_dir,
                          const std::string& base,
                          int retention_days,
                          utils::SystemClock::time_point now,
                          utils::Logger& log);

class RegionBackup {
public:
    RegionBackup(BackupPlan plan, utils::Logger& log);

    // Copies every listed file into a fresh stamped folder, then prunes old
    // copies of each copied file. Throws BackupError on root directory
    // problems; per-file problems are logged and counted.
    BackupResult run(utils::SystemClock::time_point now) const;

private:
    BackupPlan plan_;
    utils::Logger& log_;
};

} // namespace backup
