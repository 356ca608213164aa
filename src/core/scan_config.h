#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "hardlink_scanner.h"
#include "utils/config.h"
#include "utils/logging.h"

namespace core {

// Typed, validated scanner configuration. Built once at startup.
struct ScanConfiguration {
    std::filesystem::path folder_path;  // absolute, existing directory
    std::filesystem::path output_path;  // absolute
    utils::LogLevel log_level = utils::LogLevel::Info;
    std::string log_file;               // empty = console only
    bool timestamp_output = false;
    bool report_hardlinked = false;
    std::size_t progress_interval = 1000;

    ScanOptions scan_options() const {
        return ScanOptions{report_hardlinked, progress_interval};
    }
};

// Env override prefix for scanner keys: HLC_FOLDER_PATH, ...
inline constexpr const char* kScanEnvPrefix = "HLC_";

// Validates cfg. Throws ConfigurationError naming the key or path at fault.
ScanConfiguration scan_configuration_from(const utils::Config& cfg);

// Reads the JSON file at path and validates it. Throws ConfigurationError.
ScanConfiguration load_scan_configuration(const std::string& path);

} // namespace core
