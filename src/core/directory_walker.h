#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

namespace core {

enum class EntryKind {
    Regular,
    Symlink,
    Other,   // device, socket, FIFO, ...
    Error,   // could not be listed or typed; see WalkEntry::error
};

const char* entry_kind_name(EntryKind kind);

struct WalkEntry {
    std::filesystem::path path;
    EntryKind kind = EntryKind::Regular;
    std::error_code error;
};

// Pull-based depth-first walk over a directory tree.
//
// Directories are descended into, never yielded. Symlinks are not followed.
// Within one directory, files come first in name order, then subdirectories
// are visited in name order, so a walk over an unchanged tree is stable.
// A walker is single-use: construct a new one for each scan.
class DirectoryWalker {
public:
    explicit DirectoryWalker(std::filesystem::path root);

    DirectoryWalker(const DirectoryWalker&) = delete;
    DirectoryWalker& operator=(const DirectoryWalker&) = delete;

    // Next entry, or nullopt once the tree is exhausted.
    std::optional<WalkEntry> next();

    std::size_t directories_visited() const { return directories_visited_; }

private:
    std::vector<std::filesystem::path> pending_dirs_;
    std::deque<WalkEntry> ready_;
    std::size_t directories_visited_ = 0;

    void expand_(const std::filesystem::path& dir);
};

} // namespace core
