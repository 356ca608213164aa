#include "region_backup.h"

#include <chrono>
#include <system_error>

#include <sys/stat.h>

namespace backup {

namespace fs = std::filesystem;

namespace {

std::string require_string(const utils::Config& cfg, const std::string& key) {
    if (!cfg.has(key) || !cfg.is_string(key) || cfg.get_string(key).empty()) {
        throw BackupError("configuration key " + key + " is required and must be a non-empty string");
    }
    return cfg.get_string(key);
}

} // namespace

BackupPlan backup_plan_from(const utils::Config& cfg) {
    BackupPlan p;
    p.source_dir = require_string(cfg, "source_dir");
    p.watch_dir = require_string(cfg, "watch_dir");

    auto files = cfg.get_list("files");
    if (!files.has_value() || files->empty()) {
        throw BackupError("configuration key files is required and must be a non-empty array");
    }
    for (const auto& f : *files) {
        if (f.empty() || f.find('/') != std::string::npos) {
            throw BackupError("invalid entry in files: '" + f + "'");
        }
    }
    p.files = *files;

    if (cfg.has("retention_days")) {
        auto d = cfg.get_int_opt("retention_days");
        if (!d.has_value() || *d < 0 || *d > 36500) {
            throw BackupError("configuration key retention_days must be a non-negative integer");
        }
        p.retention_days = (int)*d;
    }

    if (cfg.has("log_level")) {
        auto lvl = utils::parse_log_level(cfg.get_string("log_level"));
        if (!lvl.has_value()) {
            throw BackupError("invalid log_level '" + cfg.get_string("log_level") + "'");
        }
        p.log_level = *lvl;
    }
    return p;
}

BackupPlan load_backup_plan(const std::string& path) {
    utils::Config cfg(kBackupEnvPrefix);
    std::string err;
    if (!cfg.load_file(path, &err)) {
        throw BackupError("cannot load configuration file " + path + ": " + err);
    }
    return backup_plan_from(cfg);
}

std::pair<std::string, std::string> split_extension(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) return {filename, ""};
    return {filename.substr(0, dot), filename.substr(dot + 1)};
}

std::string stamped_name(const std::string& filename, const std::string& stamp) {
    auto [base, ext] = split_extension(filename);
    if (filename.rfind('.') == std::string::npos) return base + "_" + stamp;
    return base + "_" + stamp + "." + ext;
}

bool is_backup_copy_of(const std::string& filename, const std::string& base) {
    const std::string prefix = base + "_";
    if (filename.compare(0, prefix.size(), prefix) != 0) return false;

    std::string rest = filename.substr(prefix.size());
    const std::size_t stamp_len = 19; // YYYY-MM-DD_HH-MM-SS
    if (rest.size() < stamp_len) return false;
    if (!utils::is_file_stamp(rest.substr(0, stamp_len))) return false;

    return rest.size() == stamp_len || rest[stamp_len] == '.';
}

std::size_t prune_expired(const fs::path& watch_dir,
                          const std::string& base,
                          int retention_days,
                          utils::SystemClock::time_point now,
                          utils::Logger& log) {
    const auto cutoff = now - std::chrono::hours(24) * retention_days;

    // collect first, delete after, so removal never disturbs the iterator
    std::vector<fs::path> expired;
    std::error_code ec;
    fs::recursive_directory_iterator it(watch_dir, ec);
    if (ec) {
        log.warning("Cannot scan " + watch_dir.string() + " for old copies: " + ec.message());
        return 0;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            log.warning("Error while scanning " + watch_dir.string() + ": " + ec.message());
            break;
        }
        std::error_code st_ec;
        if (!fs::is_regular_file(it->symlink_status(st_ec)) || st_ec) continue;
        if (!is_backup_copy_of(it->path().filename().string(), base)) continue;

        struct stat st{};
        if (::lstat(it->path().c_str(), &st) != 0) continue;
        if (utils::from_timespec(st.st_mtim) < cutoff) expired.push_back(it->path());
    }

    std::size_t removed = 0;
    for (const auto& p : expired) {
        std::error_code rm_ec;
        if (fs::remove(p, rm_ec)) {
            ++removed;
            log.info("removed '" + p.string() + "'");
        } else if (rm_ec) {
            log.warning("Failed to remove " + p.string() + ": " + rm_ec.message());
        }
    }
    return removed;
}

RegionBackup::RegionBackup(BackupPlan plan, utils::Logger& log)
    : plan_(std::move(plan)), log_(log) {}

BackupResult RegionBackup::run(utils::SystemClock::time_point now) const {
    std::error_code ec;
    if (!fs::is_directory(plan_.source_dir, ec)) {
        throw BackupError("Source directory '" + plan_.source_dir.string() + "' does not exist.");
    }

    if (!fs::is_directory(plan_.watch_dir, ec)) {
        log_.warning("Destination directory '" + plan_.watch_dir.string() +
                     "' does not exist. Creating it now...");
        fs::create_directories(plan_.watch_dir, ec);
        if (ec) {
            throw BackupError("Cannot create destination directory '" + plan_.watch_dir.string() +
                              "': " + ec.message());
        }
    }

    BackupResult r;
    r.stamp = utils::format_file_stamp(now);
    r.dest_dir = plan_.watch_dir / r.stamp;
    fs::create_directories(r.dest_dir, ec);
    if (ec) {
        throw BackupError("Cannot create backup folder '" + r.dest_dir.string() + "': " + ec.message());
    }

    for (const auto& name : plan_.files) {
        fs::path src = plan_.source_dir / name;
        std::error_code st_ec;
        if (!fs::is_regular_file(src, st_ec)) {
            log_.warning("File '" + src.string() + "' does not exist. Skipping...");
            r.missing++;
            continue;
        }

        fs::path dst = r.dest_dir / stamped_name(name, r.stamp);
        std::error_code cp_ec;
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing, cp_ec);
        if (cp_ec) {
            log_.error("Failed to copy '" + src.string() + "' to '" + dst.string() + "': " + cp_ec.message());
            r.failed++;
            continue;
        }
        r.copied++;
        log_.info("File '" + src.string() + "' copied to '" + dst.string() + "'");

        const std::string base = split_extension(name).first;
        log_.debug("Cleaning up files older than " + std::to_string(plan_.retention_days) +
                   " days for '" + base + "_*' in '" + plan_.watch_dir.string() + "'...");
        r.pruned += prune_expired(plan_.watch_dir, base, plan_.retention_days, now, log_);
    }

    log_.info("Processing complete. Files are saved in folder: " + r.dest_dir.string() +
              " (copied=" + std::to_string(r.copied) +
              " missing=" + std::to_string(r.missing) +
              " failed=" + std::to_string(r.failed) +
              " pruned=" + std::to_string(r.pruned) + ")");
    return r;
}

} // namespace backup
