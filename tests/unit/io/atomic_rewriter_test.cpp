#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include <spindle/gcode/speed_locator.h>
#include <spindle/io/atomic_rewriter.h>

#include "common/test_helpers.h"

#include <sys/stat.h>
#include <unistd.h>

using namespace spindle;
using namespace spindle::io;
namespace fs = std::filesystem;

namespace {

std::size_t countEntries(const fs::path& dir) {
    std::size_t n = 0;
    for ([[maybe_unused]] const auto& e : fs::directory_iterator(dir))
        ++n;
    return n;
}

gcode::TokenMatch locateOrDie(std::string_view text) {
    auto match = gcode::SpeedTokenLocator().locate(text);
    EXPECT_TRUE(match.has_value());
    return match.value_or(gcode::TokenMatch{});
}

} // namespace

TEST(ApplySpeedTest, ReplacesOnlyTheNumericSpan) {
    const std::string original = "%\r\nG21 (mm)\r\nS8000 M3\r\nG1 X1 F100\r\n";
    auto patched = applySpeed(original, locateOrDie(original), 12000.0);
    ASSERT_TRUE(patched);
    EXPECT_EQ(patched.value(), "%\r\nG21 (mm)\r\nS12000 M3\r\nG1 X1 F100\r\n");
}

TEST(ApplySpeedTest, ShorterReplacementKeepsSurroundingText) {
    const std::string original = "G0 X0 Y0 S18000.0 M3\nG1 Z-1\n";
    auto patched = applySpeed(original, locateOrDie(original), 900.0);
    ASSERT_TRUE(patched);
    EXPECT_EQ(patched.value(), "G0 X0 Y0 S900 M3\nG1 Z-1\n");
}

TEST(ApplySpeedTest, RoundTripAndIdempotence) {
    const std::string original = "T1 M6\nS5000 M3\nG1 X5 F200\nS6000\n";
    auto once = applySpeed(original, locateOrDie(original), 14500.0);
    ASSERT_TRUE(once);

    auto relocated = gcode::SpeedTokenLocator().locate(once.value());
    ASSERT_TRUE(relocated.has_value());
    EXPECT_DOUBLE_EQ(relocated->currentSpeed, 14500.0);

    auto twice = applySpeed(once.value(), *relocated, 14500.0);
    ASSERT_TRUE(twice);
    EXPECT_EQ(twice.value(), once.value());
    // Later speed changes are left alone
    EXPECT_NE(twice.value().find("S6000"), std::string::npos);
}

TEST(ApplySpeedTest, StaleSpanIsInvalidData) {
    gcode::TokenMatch match;
    match.offset = 100;
    match.columnSpan = {1, 5};
    auto outOfBounds = applySpeed("S8000\n", match, 1000.0);
    ASSERT_FALSE(outOfBounds);
    EXPECT_EQ(outOfBounds.error().code, ErrorCode::InvalidData);

    match.offset = 0;
    auto notNumeric = applySpeed("S8000\n", match, 1000.0);
    ASSERT_FALSE(notNumeric);
    EXPECT_EQ(notNumeric.error().code, ErrorCode::InvalidData);
}

class AtomicCommitTest : public ::testing::Test {
protected:
    test::TempDir dir_{"spindle_io_"};
};

TEST_F(AtomicCommitTest, ReplacesContentAndLeavesNoTempFiles) {
    auto target = test::write_file(dir_ / "job.tap", "S100\n");
    auto committed = commitAtomically(target, "S200\n");
    ASSERT_TRUE(committed) << committed.error().message;
    EXPECT_EQ(test::read_file(target), "S200\n");
    EXPECT_EQ(countEntries(dir_.path()), 1u);
}

TEST_F(AtomicCommitTest, PreservesPermissionBits) {
    auto target = test::write_file(dir_ / "job.tap", "S100\n");
    ASSERT_EQ(::chmod(target.c_str(), 0640), 0);

    ASSERT_TRUE(commitAtomically(target, "S200\n"));
    struct stat st {};
    ASSERT_EQ(::stat(target.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0640u);
}

TEST_F(AtomicCommitTest, FailureBeforeReplaceLeavesOriginalUntouched) {
    const std::string original = "%\nS8000 M3\nG1 X1\n";
    auto target = test::write_file(dir_ / "job.tap", original);

    fs::path seenTemp;
    CommitOptions options;
    options.beforeReplace = [&](const fs::path& temp) -> Result<void> {
        seenTemp = temp;
        EXPECT_TRUE(fs::exists(temp));
        EXPECT_EQ(test::read_file(temp), "%\nS12000 M3\nG1 X1\n");
        return Error{ErrorCode::IoError, "injected failure"};
    };

    auto result = commitAtomically(target, "%\nS12000 M3\nG1 X1\n", options);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::WriteError);
    EXPECT_EQ(result.error().message, "injected failure");

    EXPECT_EQ(test::read_file(target), original);
    EXPECT_FALSE(seenTemp.empty());
    EXPECT_EQ(seenTemp.parent_path().string(), target.parent_path().string());
    EXPECT_FALSE(fs::exists(seenTemp));
    EXPECT_EQ(countEntries(dir_.path()), 1u);
}

TEST_F(AtomicCommitTest, SymlinkTargetReplacesTheLinkedFile) {
    auto real = test::write_file(dir_ / "programs" / "job.tap", "S100\n");
    const auto link = dir_ / "job-link.tap";
    fs::create_symlink(real, link);

    ASSERT_TRUE(commitAtomically(link, "S200\n"));
    EXPECT_TRUE(fs::is_symlink(link));
    EXPECT_EQ(test::read_file(real), "S200\n");
    EXPECT_EQ(countEntries(dir_ / "programs"), 1u);
    EXPECT_EQ(countEntries(dir_.path()), 2u);
}

TEST_F(AtomicCommitTest, ReadOnlyDirectoryIsWriteError) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits are not enforced for root";
    }
    auto target = test::write_file(dir_ / "ro" / "job.tap", "S100\n");
    ::chmod((dir_ / "ro").c_str(), 0555);

    auto result = commitAtomically(target, "S200\n");
    ::chmod((dir_ / "ro").c_str(), 0755);

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::WriteError);
    EXPECT_EQ(test::read_file(target), "S100\n");
}

TEST_F(AtomicCommitTest, ReadTextFileKeepsBytesVerbatim) {
    const char raw[] = "G21\r\nS1\rM3\n\0tail";
    const std::string bytes(raw, sizeof(raw) - 1);
    auto target = test::write_file(dir_ / "raw.tap", bytes);
    auto read = readTextFile(target);
    ASSERT_TRUE(read);
    EXPECT_EQ(read.value(), bytes);
}

TEST_F(AtomicCommitTest, ReadMissingFileIsIoError) {
    auto read = readTextFile(dir_ / "missing.tap");
    ASSERT_FALSE(read);
    EXPECT_EQ(read.error().code, ErrorCode::IoError);
}
