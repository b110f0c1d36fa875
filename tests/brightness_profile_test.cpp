#include <gtest/gtest.h>
#include <sstream>
#include "brightness_profile.hpp"
#include "level_errors.hpp"

TEST(BrightnessProfileTest, ParsesFirstChannelInLineOrder)
{
    const std::string text =
        "# ImageMagick pixel enumeration: 1,3,255,gray\n"
        "0,0: ( 29, 29, 29)  #1D1D1D  gray(29,29,29)\n"
        "0,1: (255,255,255)  #FFFFFF  gray(255,255,255)\n"
        "0,2: (  0,  0,  0)  #000000  gray(0,0,0)\n";

    BrightnessProfile profile = parseBrightnessProfile(text);
    EXPECT_EQ(profile, (BrightnessProfile{29, 255, 0}));
}

TEST(BrightnessProfileTest, UsesOnlyTheFirstChannel)
{
    const std::string text =
        "header\n"
        "0,0: ( 7, 99, 200)  #0763C8  srgb(7,99,200)\n";

    EXPECT_EQ(parseBrightnessProfile(text), (BrightnessProfile{7}));
}

TEST(BrightnessProfileTest, HeaderOnlyGivesEmptyProfile)
{
    EXPECT_TRUE(parseBrightnessProfile(std::string("# ImageMagick pixel enumeration: 1,0,255,gray\n")).empty());
    EXPECT_TRUE(parseBrightnessProfile(std::string()).empty());
}

TEST(BrightnessProfileTest, IgnoresBlankLinesAndCarriageReturns)
{
    const std::string text =
        "header\r\n"
        "0,0: ( 10, 10, 10)\r\n"
        "\n"
        "0,1: ( 20, 20, 20)\r\n";

    EXPECT_EQ(parseBrightnessProfile(text), (BrightnessProfile{10, 20}));
}

TEST(BrightnessProfileTest, MalformedLineFailsWithLineNumber)
{
    const std::string text =
        "header\n"
        "0,0: ( 10, 10, 10)\n"
        "garbage here\n"
        "0,2: ( 30, 30, 30)\n";

    try
    {
        parseBrightnessProfile(text);
        FAIL() << "expected ParseError";
    }
    catch (const ParseError &e)
    {
        EXPECT_EQ(e.lineNumber(), 3u);
        EXPECT_EQ(e.line(), "garbage here");
    }
}

TEST(BrightnessProfileTest, WrongColumnIsRejected)
{
    EXPECT_THROW(parseBrightnessProfile(std::string("header\n1,0: ( 10, 10, 10)\n")), ParseError);
}

TEST(BrightnessProfileTest, LoadsDumpFromFile)
{
    BrightnessProfile profile = loadBrightnessProfile(TANK_LEVEL_TEST_DATA_DIR "/strip_dump.txt");
    ASSERT_EQ(profile.size(), 12u);
    EXPECT_EQ(profile[2], 180);
    EXPECT_EQ(profile[7], 0);
}

TEST(BrightnessProfileTest, MissingFileIsParseError)
{
    EXPECT_THROW(loadBrightnessProfile("/nonexistent/strip_dump.txt"), ParseError);
}

TEST(BrightnessProfileTest, BrightnessAboveByteRangeIsRejected)
{
    const std::string text =
        "header\n"
        "0,0: (255,255,255)\n"
        "0,1: (999,999,999)\n";

    try
    {
        parseBrightnessProfile(text);
        FAIL() << "expected ParseError";
    }
    catch (const ParseError &e)
    {
        EXPECT_EQ(e.lineNumber(), 3u);
    }
}

TEST(BrightnessProfileTest, DroppedRowIsRejected)
{
    // 缺少 0,1 行，后面的像素偏移会整体错位
    const std::string text =
        "header\n"
        "0,0: ( 10, 10, 10)\n"
        "0,2: ( 30, 30, 30)\n";

    try
    {
        parseBrightnessProfile(text);
        FAIL() << "expected ParseError";
    }
    catch (const ParseError &e)
    {
        EXPECT_EQ(e.lineNumber(), 3u);
        EXPECT_EQ(e.line(), "0,2: ( 30, 30, 30)");
    }
}

TEST(BrightnessProfileTest, RowIndexMustStartAtZero)
{
    EXPECT_THROW(parseBrightnessProfile(std::string("header\n0,1: ( 10, 10, 10)\n")), ParseError);
}
