#include "scan_config.h"

#include <system_error>

#include "errors.h"

namespace core {

namespace fs = std::filesystem;

namespace {

std::string require_string(const utils::Config& cfg, const std::string& key) {
    if (!cfg.has(key)) {
        throw ConfigurationError("missing required configuration key: " + key);
    }
    if (!cfg.is_string(key)) {
        throw ConfigurationError("configuration key " + key + " must be a string");
    }
    std::string v = cfg.get_string(key);
    if (v.empty()) {
        throw ConfigurationError("configuration key " + key + " must not be empty");
    }
    return v;
}

bool optional_bool(const utils::Config& cfg, const std::string& key, bool def) {
    if (!cfg.has(key)) return def;
    auto v = cfg.get_bool_opt(key);
    if (!v.has_value()) {
        throw ConfigurationError("configuration key " + key + " must be a boolean, got '" +
                                 cfg.get_string(key) + "'");
    }
    return *v;
}

fs::path absolute_path(const std::string& key, const std::string& raw) {
    std::error_code ec;
    fs::path p = fs::absolute(fs::path(raw), ec);
    if (ec) {
        throw ConfigurationError("cannot resolve " + key + " '" + raw + "': " + ec.message());
    }
    return p.lexically_normal();
}

} // namespace

ScanConfiguration scan_configuration_from(const utils::Config& cfg) {
    ScanConfiguration sc;

    sc.folder_path = absolute_path("folder_path", require_string(cfg, "folder_path"));
    sc.output_path = absolute_path("output_path", require_string(cfg, "output_path"));

    if (cfg.has("log_level")) {
        auto raw = cfg.get_string("log_level");
        auto lvl = utils::parse_log_level(raw);
        if (!lvl.has_value()) {
            throw ConfigurationError("invalid log_level '" + raw +
                                     "' (expected DEBUG, INFO, WARNING, ERROR or CRITICAL)");
        }
        sc.log_level = *lvl;
    }

    if (cfg.has("log_file")) {
        if (!cfg.is_string("log_file")) {
            throw ConfigurationError("configuration key log_file must be a string");
        }
        sc.log_file = cfg.get_string("log_file");
    }

    sc.timestamp_output = optional_bool(cfg, "timestamp_output", false);
    sc.report_hardlinked = optional_bool(cfg, "report_hardlinked", false);

    if (cfg.has("progress_interval")) {
        auto n = cfg.get_int_opt("progress_interval");
        if (!n.has_value() || *n <= 0) {
            throw ConfigurationError("configuration key progress_interval must be a positive integer");
        }
        sc.progress_interval = (std::size_t)*n;
    }

    std::error_code ec;
    if (!fs::exists(sc.folder_path, ec)) {
        throw ConfigurationError("folder_path does not exist: " + sc.folder_path.string());
    }
    if (!fs::is_directory(sc.folder_path, ec)) {
        throw ConfigurationError("folder_path is not a directory: " + sc.folder_path.string());
    }

    return sc;
}

ScanConfiguration load_scan_configuration(const std::string& path) {
    utils::Config cfg(kScanEnvPrefix);
    std::string err;
    if (!cfg.load_file(path, &err)) {
        throw ConfigurationError("cannot load configuration file " + path + ": " + err);
    }
    return scan_configuration_from(cfg);
}

} // namespace core
