#include <gtest/gtest.h>

#include <string>

#include <spindle/gcode/speed_locator.h>

using namespace spindle::gcode;

namespace {

// Typical Vectric-style post output
constexpr const char* kVectricProgram = "T1 M6\n"
                                        "G0 Z0.2000\n"
                                        "G0 X0.0000 Y0.0000 S16000 M3\n"
                                        "G1 Z-0.1250 F30.0\n"
                                        "G1 X1.0000 F60.0\n"
                                        "S18000\n";

} // namespace

TEST(SpeedLocatorTest, FindsSpeedWordAndSpan) {
    SpeedTokenLocator locator;
    std::string text = "%\nG21\nS8000 M3\nG1 X1 F100\n";

    auto match = locator.locate("prog.tap", text);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->filePath.string(), "prog.tap");
    EXPECT_EQ(match->lineIndex, 2u);
    EXPECT_EQ(match->columnSpan.begin, 1u);
    EXPECT_EQ(match->columnSpan.end, 5u);
    EXPECT_EQ(match->literal, "8000");
    EXPECT_DOUBLE_EQ(match->currentSpeed, 8000.0);
    EXPECT_EQ(text.substr(match->offset, match->columnSpan.length()), "8000");
}

TEST(SpeedLocatorTest, FirstMatchWinsAndRapidsDoNotEndWindow) {
    SpeedTokenLocator locator;
    auto match = locator.locate(kVectricProgram);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->lineIndex, 2u);
    EXPECT_EQ(match->literal, "16000");
}

TEST(SpeedLocatorTest, LowercaseLetterAndDecimalLiteral) {
    SpeedTokenLocator locator;
    auto match = locator.locate("g21\ns12000.5 m3\n");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->literal, "12000.5");
    EXPECT_DOUBLE_EQ(match->currentSpeed, 12000.5);
}

TEST(SpeedLocatorTest, IgnoresCommentsAndWordsEndingInS) {
    SpeedTokenLocator locator;
    std::string text = "(S9999 in a comment)\n"
                       "; S7777 also a comment\n"
                       "G20 (units) ; S5555\n"
                       "M3 S4000 (spindle on)\n";
    auto match = locator.locate(text);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->lineIndex, 3u);
    EXPECT_EQ(match->literal, "4000");
}

TEST(SpeedLocatorTest, RequiresDigitImmediatelyAfterLetter) {
    SpeedTokenLocator locator;
    EXPECT_FALSE(locator.locate("S\nS-100\nS 100\nPASS1\n").has_value());
}

TEST(SpeedLocatorTest, LineWindowBoundsSearch) {
    LocatorOptions opts;
    opts.searchWindowLines = 3;
    opts.stopAtMotion = false;
    SpeedTokenLocator locator(opts);

    EXPECT_FALSE(locator.locate("G21\nG90\nG17\nS1000\n").has_value());
    EXPECT_TRUE(locator.locate("G21\nG90\nS1000\n").has_value());
}

TEST(SpeedLocatorTest, ZeroWindowSearchesWholeFile) {
    LocatorOptions opts;
    opts.searchWindowLines = 0;
    opts.stopAtMotion = false;
    SpeedTokenLocator locator(opts);

    std::string text;
    for (int i = 0; i < 200; ++i)
        text += "G0 X" + std::to_string(i) + "\n";
    text += "S3000\n";
    auto match = locator.locate(text);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->lineIndex, 200u);
}

TEST(SpeedLocatorTest, FirstFeedMoveEndsSearchButItsOwnSpeedCounts) {
    SpeedTokenLocator locator;
    EXPECT_FALSE(locator.locate("G21\nG1 X10 F100\nS12000\n").has_value());

    auto onMotionLine = locator.locate("G21\nG01 X10 F100 S9000\nS12000\n");
    ASSERT_TRUE(onMotionLine.has_value());
    EXPECT_EQ(onMotionLine->literal, "9000");

    LocatorOptions opts;
    opts.stopAtMotion = false;
    EXPECT_TRUE(SpeedTokenLocator(opts).locate("G21\nG1 X10 F100\nS12000\n").has_value());
}

TEST(SpeedLocatorTest, MotionLineDetection) {
    EXPECT_TRUE(SpeedTokenLocator::isMotionLine("G1 X1"));
    EXPECT_TRUE(SpeedTokenLocator::isMotionLine("g02 X1 Y1 I1 J0"));
    EXPECT_TRUE(SpeedTokenLocator::isMotionLine("N10 G3 X0"));
    EXPECT_FALSE(SpeedTokenLocator::isMotionLine("G0 X1"));
    EXPECT_FALSE(SpeedTokenLocator::isMotionLine("G38.2 Z-10"));
    EXPECT_FALSE(SpeedTokenLocator::isMotionLine("G10 L2 P1"));
    EXPECT_FALSE(SpeedTokenLocator::isMotionLine("(G1 only in a comment)"));
    EXPECT_FALSE(SpeedTokenLocator::isMotionLine("M3 ; G1"));
}

TEST(SpeedLocatorTest, HandlesAllLineTerminators) {
    SpeedTokenLocator locator;

    auto crlf = locator.locate("G21\r\nG90\r\nS500 M3\r\n");
    ASSERT_TRUE(crlf.has_value());
    EXPECT_EQ(crlf->lineIndex, 2u);
    EXPECT_EQ(crlf->offset, 11u);

    auto cr = locator.locate("G21\rG90\rS500 M3\r");
    ASSERT_TRUE(cr.has_value());
    EXPECT_EQ(cr->lineIndex, 2u);
    EXPECT_EQ(cr->offset, 9u);

    auto noTrailing = locator.locate("G21\nS750");
    ASSERT_TRUE(noTrailing.has_value());
    EXPECT_EQ(noTrailing->literal, "750");
}

TEST(SpeedLocatorTest, EmptyInputHasNoMatch) {
    SpeedTokenLocator locator;
    EXPECT_FALSE(locator.locate("").has_value());
    EXPECT_FALSE(locator.locate("\n\n\n").has_value());
}

TEST(SpeedLocatorTest, CustomCommandLetter) {
    LocatorOptions opts;
    opts.commandLetter = 'f';
    SpeedTokenLocator locator(opts);
    auto match = locator.locate("G0 X1 S100\nF250\n");
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->literal, "250");
}
