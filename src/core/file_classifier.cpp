#include "file_classifier.h"

#include <cerrno>
#include <sys/stat.h>
#include <sys/types.h>

namespace core {

ClassifiedFile FileClassifier::classify(const std::string& path) const {
    ClassifiedFile out;

    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        out.kind = Classification::Error;
        out.error = std::error_code(errno, std::generic_category());
        return out;
    }

    if (!S_ISREG(st.st_mode)) {
        out.kind = Classification::Skipped;
        return out;
    }

    FileRecord r;
    r.path = path;
    r.size_bytes = (std::uintmax_t)st.st_size;
    r.link_count = (std::uintmax_t)st.st_nlink;
    r.inode = (std::uintmax_t)st.st_ino;
    r.modified_time = utils::from_timespec(st.st_mtim);

    out.kind = r.is_hardlinked() ? Classification::Hardlinked : Classification::NonHardlinked;
    out.record = std::move(r);
    return out;
}

} // namespace core
