#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <spindle/cli/summary_renderer.h>
#include <spindle/cli/ui_helpers.hpp>

using namespace spindle;
using namespace spindle::batch;
using namespace spindle::cli;

namespace {

BatchSummary mixedSummary() {
    BatchSummary s;
    s.rootPath = "/jobs";
    s.requestedSpeed = 12000.0;
    s.discovered = 3;
    s.total = 3;
    s.updatedCount = 1;
    s.skippedCount = 1;
    s.failedCount = 1;
    s.elapsed = std::chrono::milliseconds(42);

    FileOutcome a;
    a.filePath = "/jobs/a.tap";
    a.index = 0;
    a.status = FileStatus::Updated;
    a.oldSpeed = 8000.0;
    a.newSpeed = 12000.0;
    a.lineIndex = 2;

    FileOutcome b;
    b.filePath = "/jobs/b.tap";
    b.index = 1;
    b.status = FileStatus::Skipped;
    b.reason = kNoMatchReason;

    FileOutcome c;
    c.filePath = "/jobs/c.tap";
    c.index = 2;
    c.status = FileStatus::Failed;
    c.reason = "IOError: Failed to open '/jobs/c.tap': Permission denied";
    c.error = Error{ErrorCode::IoError, "Failed to open '/jobs/c.tap': Permission denied"};

    s.outcomes = {a, b, c};
    s.diagnostics.push_back(scan::ScanDiagnostic{"/jobs/broken.tap", "dangling symbolic link"});
    return s;
}

class SummaryRendererTest : public ::testing::Test {
protected:
    void SetUp() override { ui::set_color_mode(ui::ColorMode::ForceOff); }
    void TearDown() override { ui::set_color_mode(ui::ColorMode::Auto); }
};

} // namespace

TEST_F(SummaryRendererTest, JsonCarriesCountsAndOutcomes) {
    auto j = summaryToJson(mixedSummary());
    EXPECT_EQ(j["root"], "/jobs");
    EXPECT_TRUE(j["requested_speed"].is_number_integer());
    EXPECT_EQ(j["requested_speed"], 12000);
    EXPECT_EQ(j["total"], 3);
    EXPECT_EQ(j["updated"], 1);
    EXPECT_EQ(j["skipped"], 1);
    EXPECT_EQ(j["failed"], 1);
    EXPECT_EQ(j["cancelled"], false);
    EXPECT_EQ(j["dry_run"], false);
    EXPECT_EQ(j["elapsed_ms"], 42);

    ASSERT_EQ(j["files"].size(), 3u);
    const auto& a = j["files"][0];
    EXPECT_EQ(a["status"], "updated");
    EXPECT_EQ(a["old_speed"], 8000);
    EXPECT_EQ(a["new_speed"], 12000);
    EXPECT_EQ(a["line"], 3);
    EXPECT_FALSE(a.contains("reason"));

    EXPECT_EQ(j["files"][1]["reason"], kNoMatchReason);

    const auto& c = j["files"][2];
    EXPECT_EQ(c["status"], "failed");
    EXPECT_EQ(c["error"], "IOError");

    ASSERT_EQ(j["diagnostics"].size(), 1u);
    EXPECT_EQ(j["diagnostics"][0]["message"], "dangling symbolic link");
}

TEST_F(SummaryRendererTest, FractionalSpeedStaysFloat) {
    EXPECT_TRUE(speedToJson(8500.5).is_number_float());
    EXPECT_TRUE(speedToJson(8500.0).is_number_integer());
}

TEST_F(SummaryRendererTest, TextListsFailuresAlwaysAndDetailsWhenVerbose) {
    std::ostringstream quiet;
    renderSummary(quiet, mixedSummary(), false);
    const auto q = quiet.str();
    EXPECT_NE(q.find("/jobs/c.tap: IOError"), std::string::npos);
    EXPECT_EQ(q.find("/jobs/a.tap"), std::string::npos);
    EXPECT_NE(q.find("dangling symbolic link"), std::string::npos);
    EXPECT_NE(q.find("Processed 3 of 3 file(s) in 42 ms: 1 updated, 1 skipped, 1 failed"),
              std::string::npos);
    EXPECT_EQ(q.find("Spindle speed set to"), std::string::npos);

    std::ostringstream verbose;
    renderSummary(verbose, mixedSummary(), true);
    EXPECT_NE(verbose.str().find("/jobs/a.tap: S8000 -> S12000"), std::string::npos);
    EXPECT_NE(verbose.str().find("/jobs/b.tap: no spindle-speed command found"),
              std::string::npos);
}

TEST_F(SummaryRendererTest, CleanRunReportsNewSpeed) {
    BatchSummary s;
    s.requestedSpeed = 9000.0;
    s.discovered = s.total = s.updatedCount = 2;
    std::ostringstream os;
    renderSummary(os, s, false);
    EXPECT_NE(os.str().find("Spindle speed set to S9000"), std::string::npos);
}

TEST_F(SummaryRendererTest, DryRunAndCancelledWording) {
    BatchSummary s;
    s.dryRun = true;
    s.cancelled = true;
    s.discovered = 5;
    s.total = s.updatedCount = 2;
    std::ostringstream os;
    renderSummary(os, s, false);
    EXPECT_NE(os.str().find("Dry run: Processed 2 of 5 file(s)"), std::string::npos);
    EXPECT_NE(os.str().find("2 would be updated"), std::string::npos);
    EXPECT_NE(os.str().find("Cancelled before all files were processed"), std::string::npos);
}

TEST_F(SummaryRendererTest, ConfigJsonReflectsSource) {
    config::SpindleConfig cfg;
    auto j = configToJson(cfg);
    EXPECT_TRUE(j["source"].is_null());
    EXPECT_EQ(j["max_rpm"], 24000);
    EXPECT_EQ(j["file_extension"], ".tap");
    EXPECT_EQ(j["search_window_lines"], 50);
}
