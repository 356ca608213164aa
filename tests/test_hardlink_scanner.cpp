#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>

#include "core/errors.h"
#include "core/hardlink_scanner.h"
#include "test_helpers.h"

using testing_helpers::TempDir;
using testing_helpers::hard_link;
using testing_helpers::write_file;

namespace {

class HardlinkScannerTest : public ::testing::Test {
protected:
    std::ostringstream log_out_;
    utils::Logger log_{log_out_};
    TempDir tmp_;

    // 3 single-link files (100, 200, 300 bytes) and one inode with 2 links
    void make_reference_tree() {
        write_file(tmp_ / "movies/a.mkv", 100);
        write_file(tmp_ / "movies/b.mkv", 200);
        write_file(tmp_ / "tv/c.mkv", 300);
        write_file(tmp_ / "downloads/shared.mkv", 50);
        hard_link(tmp_ / "downloads/shared.mkv", tmp_ / "tv/shared.mkv");
    }
};

} // namespace

TEST_F(HardlinkScannerTest, ClassifiesReferenceTree) {
    make_reference_tree();

    core::HardlinkScanner scanner(log_);
    auto r = scanner.scan(tmp_.path());
    const auto& s = r.summary;

    EXPECT_EQ(s.total_files_scanned, 5u);
    EXPECT_EQ(s.non_hardlinked_count, 3u);
    EXPECT_EQ(s.hardlinked_count, 2u);
    EXPECT_EQ(s.errors_encountered, 0u);
    EXPECT_EQ(s.total_size_non_hardlinked, 600u);
    EXPECT_EQ(s.total_size, 700u);
    EXPECT_TRUE(s.balanced());
    EXPECT_EQ(s.scan_path, tmp_.path().string());

    ASSERT_EQ(r.non_hardlinked.size(), 3u);
    for (const auto& f : r.non_hardlinked) {
        EXPECT_EQ(f.link_count, 1u);
        EXPECT_EQ(f.path.find("shared"), std::string::npos);
    }
    EXPECT_TRUE(r.hardlinked.empty());
}

TEST_F(HardlinkScannerTest, HardlinkedDetailsWhenRequested) {
    make_reference_tree();

    core::HardlinkScanner scanner(log_, core::ScanOptions{true, 1000});
    auto r = scanner.scan(tmp_.path());

    ASSERT_EQ(r.hardlinked.size(), 2u);
    EXPECT_EQ(r.hardlinked[0].inode, r.hardlinked[1].inode);
    EXPECT_EQ(r.summary.hardlinked_count, 2u);
    EXPECT_EQ(r.non_hardlinked.size(), 3u);
}

TEST_F(HardlinkScannerTest, RescanOfUnchangedTreeIsIdentical) {
    make_reference_tree();

    core::HardlinkScanner scanner(log_);
    auto first = scanner.scan(tmp_.path());
    auto second = scanner.scan(tmp_.path());

    EXPECT_EQ(first.summary.total_files_scanned, second.summary.total_files_scanned);
    EXPECT_EQ(first.summary.hardlinked_count, second.summary.hardlinked_count);
    EXPECT_EQ(first.summary.non_hardlinked_count, second.summary.non_hardlinked_count);
    EXPECT_EQ(first.summary.total_size_non_hardlinked, second.summary.total_size_non_hardlinked);
    ASSERT_EQ(first.non_hardlinked.size(), second.non_hardlinked.size());
    for (std::size_t i = 0; i < first.non_hardlinked.size(); ++i) {
        EXPECT_EQ(first.non_hardlinked[i].path, second.non_hardlinked[i].path);
    }
}

TEST_F(HardlinkScannerTest, SymlinksAndSpecialFilesAreSkipped) {
    write_file(tmp_ / "real.bin", 10);
    std::filesystem::create_symlink(tmp_ / "real.bin", tmp_ / "link.bin");
    ASSERT_EQ(::mkfifo((tmp_ / "fifo").c_str(), 0600), 0);

    core::HardlinkScanner scanner(log_);
    auto r = scanner.scan(tmp_.path());

    EXPECT_EQ(r.summary.total_files_scanned, 1u);
    EXPECT_EQ(r.summary.non_hardlinked_count, 1u);
    EXPECT_EQ(r.summary.skipped_entries, 2u);
}

TEST_F(HardlinkScannerTest, VanishedEntryIsCountedAndLogged) {
    write_file(tmp_ / "keep.bin", 7);
    write_file(tmp_ / "vanish.bin", 9);

    core::HardlinkScanner scanner(log_);
    core::ScanResult r;

    // pull entries one by one and remove a file between enumeration and stat
    core::DirectoryWalker walker(tmp_.path());
    auto first = walker.next();
    ASSERT_TRUE(first.has_value());
    std::filesystem::remove(tmp_ / "vanish.bin");
    scanner.add_entry(r, *first);
    while (auto e = walker.next()) scanner.add_entry(r, *e);

    EXPECT_EQ(r.summary.total_files_scanned, 2u);
    EXPECT_EQ(r.summary.non_hardlinked_count, 1u);
    EXPECT_EQ(r.summary.errors_encountered, 1u);
    EXPECT_TRUE(r.summary.balanced());
    EXPECT_EQ(r.non_hardlinked.size(), 1u);
    EXPECT_NE(log_out_.str().find("[WARNING] Error processing " + (tmp_ / "vanish.bin").string()),
              std::string::npos);
}

TEST_F(HardlinkScannerTest, WalkerErrorEntryCounts) {
    core::HardlinkScanner scanner(log_);
    core::ScanResult r;
    scanner.add_entry(r, core::WalkEntry{tmp_ / "x", core::EntryKind::Error,
                                         std::make_error_code(std::errc::permission_denied)});
    EXPECT_EQ(r.summary.errors_encountered, 1u);
    EXPECT_EQ(r.summary.total_files_scanned, 1u);
    EXPECT_TRUE(r.summary.balanced());
}

TEST_F(HardlinkScannerTest, LogsProgressAtInterval) {
    for (int i = 0; i < 5; ++i) write_file(tmp_ / ("f" + std::to_string(i)), 1);

    core::HardlinkScanner scanner(log_, core::ScanOptions{false, 2});
    scanner.scan(tmp_.path());

    auto text = log_out_.str();
    EXPECT_NE(text.find("Processed 2 files..."), std::string::npos);
    EXPECT_NE(text.find("Processed 4 files..."), std::string::npos);
    EXPECT_EQ(text.find("Processed 5 files..."), std::string::npos);
    EXPECT_NE(text.find("Scan complete. Processed 5 files"), std::string::npos);
}

TEST_F(HardlinkScannerTest, EmptyTree) {
    core::HardlinkScanner scanner(log_);
    auto r = scanner.scan(tmp_.path());
    EXPECT_EQ(r.summary.total_files_scanned, 0u);
    EXPECT_TRUE(r.summary.balanced());
}

TEST_F(HardlinkScannerTest, MissingRootThrowsConfigurationError) {
    core::HardlinkScanner scanner(log_);
    EXPECT_THROW(scanner.scan(tmp_ / "missing"), core::ConfigurationError);

    write_file(tmp_ / "plain.bin", 1);
    EXPECT_THROW(scanner.scan(tmp_ / "plain.bin"), core::ConfigurationError);
}
