#pragma once

#include <optional>
#include <string>
#include <system_error>

#include "file_record.h"

namespace core {

enum class Classification {
    NonHardlinked,  // link count == 1
    Hardlinked,     // link count > 1
    Skipped,        // no longer a regular file when stat'ed
    Error,          // lstat failed (permission denied, vanished, ...)
};

struct ClassifiedFile {
    Classification kind = Classification::Error;
    std::optional<FileRecord> record;  // set for NonHardlinked / Hardlinked
    std::error_code error;             // set for Error
};

class FileClassifier {
public:
    // lstat the path and classify it by link count. Never throws for
    // filesystem errors; they come back as Classification::Error.
    ClassifiedFile classify(const std::string& path) const;
};

} // namespace core
