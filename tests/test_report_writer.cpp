#include <gtest/gtest.h>

#include <sstream>

#include "core/errors.h"
#include "core/report_writer.h"
#include "test_helpers.h"

using testing_helpers::TempDir;

namespace {

core::FileRecord record(const std::string& path, std::uintmax_t size, std::uintmax_t links, std::uintmax_t ino) {
    core::FileRecord r;
    r.path = path;
    r.size_bytes = size;
    r.link_count = links;
    r.inode = ino;
    return r;
}

core::ScanResult sample_result() {
    core::ScanResult r;
    auto& s = r.summary;
    s.scan_path = "/data/media";
    s.scan_timestamp = "2024-05-01 12:00:00";
    s.total_files_scanned = 5;
    s.hardlinked_count = 2;
    s.non_hardlinked_count = 3;
    s.total_size = 2048;
    s.total_size_non_hardlinked = 1536;
    r.non_hardlinked.push_back(record("/data/media/a.mkv", 512, 1, 11));
    r.non_hardlinked.push_back(record("/data/media/b.mkv", 512, 1, 12));
    r.non_hardlinked.push_back(record("/data/media/c.mkv", 512, 1, 13));
    return r;
}

} // namespace

TEST(ReportWriter, RendersSummaryAndDetails) {
    std::ostringstream out;
    core::render_report(out, sample_result());
    auto text = out.str();

    EXPECT_EQ(text.rfind(std::string(80, '=') + "\nHARDLINK CHECK REPORT\n", 0), 0u);
    EXPECT_NE(text.find("Scan Path:                 /data/media\n"), std::string::npos);
    EXPECT_NE(text.find("Total Files Scanned:       5\n"), std::string::npos);
    EXPECT_NE(text.find("Hardlinked Files:          2\n"), std::string::npos);
    EXPECT_NE(text.find("Non-Hardlinked Files:      3\n"), std::string::npos);
    EXPECT_NE(text.find("Non-Hardlinked Size:       1.50 KB (1536 bytes)\n"), std::string::npos);
    EXPECT_NE(text.find("Percentage Not Hardlinked: 60.00%\n"), std::string::npos);
    EXPECT_NE(text.find("NON-HARDLINKED FILES"), std::string::npos);
    EXPECT_NE(text.find("[3] /data/media/c.mkv\n"), std::string::npos);
    EXPECT_NE(text.find("    Size:         512.00 B (512 bytes)\n"), std::string::npos);
    EXPECT_NE(text.find("    Inode:        12\n"), std::string::npos);
    EXPECT_EQ(text.find("\nHARDLINKED FILES\n"), std::string::npos);
    EXPECT_EQ(text.find("All files are properly hardlinked!"), std::string::npos);
}

TEST(ReportWriter, AllHardlinkedMessage) {
    core::ScanResult r;
    r.summary.total_files_scanned = 2;
    r.summary.hardlinked_count = 2;

    std::ostringstream out;
    core::render_report(out, r);
    EXPECT_NE(out.str().find("All files are properly hardlinked!"), std::string::npos);
    EXPECT_EQ(out.str().find("NON-HARDLINKED FILES"), std::string::npos);
}

TEST(ReportWriter, HardlinkedSection) {
    auto r = sample_result();
    r.hardlinked.push_back(record("/data/media/x.mkv", 256, 2, 99));

    std::ostringstream out;
    core::render_report(out, r);
    auto text = out.str();
    auto pos = text.find("\nHARDLINKED FILES\n");
    ASSERT_NE(pos, std::string::npos);
    EXPECT_NE(text.find("[1] /data/media/x.mkv", pos), std::string::npos);
    EXPECT_NE(text.find("    Link Count:   2\n", pos), std::string::npos);
}

TEST(ReportWriter, WritesFileCreatingParentsAndOverwriting) {
    TempDir tmp;
    auto path = tmp / "reports/nested/report.txt";

    core::write_report(path, sample_result());
    auto first = testing_helpers::read_file(path);
    EXPECT_NE(first.find("Non-Hardlinked Files:      3"), std::string::npos);

    core::ScanResult empty;
    core::write_report(path, empty);
    auto second = testing_helpers::read_file(path);
    EXPECT_EQ(second.find("/data/media/a.mkv"), std::string::npos);
    EXPECT_NE(second.find("All files are properly hardlinked!"), std::string::npos);
}

TEST(ReportWriter, UnwritablePathThrows) {
    TempDir tmp;
    testing_helpers::write_file(tmp / "not-a-dir", 1);
    auto path = tmp / "not-a-dir/report.txt";

    try {
        core::write_report(path, sample_result());
        FAIL() << "expected ReportWriteError";
    } catch (const core::ReportWriteError& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
}

TEST(ReportWriter, ConsoleSummary) {
    auto r = sample_result();

    std::ostringstream ok;
    core::print_console_summary(ok, r.summary, std::string("/tmp/report.txt"));
    EXPECT_NE(ok.str().find("SCAN COMPLETE"), std::string::npos);
    EXPECT_NE(ok.str().find("Non-hardlinked files:     3\n"), std::string::npos);
    EXPECT_NE(ok.str().find("Report saved to:          /tmp/report.txt\n"), std::string::npos);

    std::ostringstream failed;
    core::print_console_summary(failed, r.summary, std::nullopt, "disk full");
    EXPECT_NE(failed.str().find("Report NOT saved:         disk full\n"), std::string::npos);
    EXPECT_NE(failed.str().find("Total files scanned:      5\n"), std::string::npos);
}

TEST(ReportWriter, TimestampedOutputPath) {
    auto p = core::timestamped_output_path("/var/reports/hardlinks.txt", "2024-05-01_12-00-00");
    EXPECT_EQ(p, std::filesystem::path("/var/reports/hardlinks_2024-05-01_12-00-00.txt"));

    auto bare = core::timestamped_output_path("/var/reports/hardlinks", "2024-05-01_12-00-00");
    EXPECT_EQ(bare, std::filesystem::path("/var/reports/hardlinks_2024-05-01_12-00-00"));
}
