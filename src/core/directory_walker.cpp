#include "directory_walker.h"

#include <algorithm>
#include <utility>

namespace core {

namespace fs = std::filesystem;

const char* entry_kind_name(EntryKind kind) {
    switch (kind) {
        case EntryKind::Regular: return "regular";
        case EntryKind::Symlink: return "symlink";
        case EntryKind::Other:   return "special";
        case EntryKind::Error:   return "error";
        default:                 return "unknown";
    }
}

DirectoryWalker::DirectoryWalker(fs::path root) {
    pending_dirs_.push_back(std::move(root));
}

std::optional<WalkEntry> DirectoryWalker::next() {
    while (ready_.empty()) {
        if (pending_dirs_.empty()) return std::nullopt;
        fs::path dir = std::move(pending_dirs_.back());
        pending_dirs_.pop_back();
        expand_(dir);
    }

    WalkEntry e = std::move(ready_.front());
    ready_.pop_front();
    return e;
}

void DirectoryWalker::expand_(const fs::path& dir) {
    ++directories_visited_;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        ready_.push_back(WalkEntry{dir, EntryKind::Error, ec});
        return;
    }

    std::vector<WalkEntry> files;
    std::vector<fs::path> subdirs;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;

        std::error_code st_ec;
        fs::file_status st = it->symlink_status(st_ec);
        if (st_ec) {
            files.push_back(WalkEntry{it->path(), EntryKind::Error, st_ec});
            continue;
        }

        if (fs::is_directory(st)) {
            subdirs.push_back(it->path());
        } else if (fs::is_symlink(st)) {
            files.push_back(WalkEntry{it->path(), EntryKind::Symlink, {}});
        } else if (fs::is_regular_file(st)) {
            files.push_back(WalkEntry{it->path(), EntryKind::Regular, {}});
        } else {
            files.push_back(WalkEntry{it->path(), EntryKind::Other, {}});
        }
    }

    // stable order for reproducibility
    std::sort(files.begin(), files.end(), [](const WalkEntry& a, const WalkEntry& b) {
        return a.path.filename() < b.path.filename();
    });
    std::sort(subdirs.begin(), subdirs.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename() < b.filename();
    });

    for (auto& f : files) ready_.push_back(std::move(f));

    // iteration stopped early: report the directory itself after what was read
    if (ec) ready_.push_back(WalkEntry{dir, EntryKind::Error, ec});

    // stack: push in reverse so the smallest name is expanded first
    for (auto rit = subdirs.rbegin(); rit != subdirs.rend(); ++rit) {
        pending_dirs_.push_back(std::move(*rit));
    }
}

} // namespace core
