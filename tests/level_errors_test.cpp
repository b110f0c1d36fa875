#include <gtest/gtest.h>
#include "level_errors.hpp"

TEST(LevelErrorsTest, ExitCodePerErrorType)
{
    EXPECT_EQ(exitCodeForError(ConfigError("bad option")), 1);
    EXPECT_EQ(exitCodeForError(AcquisitionError("curl failed")), 2);
    EXPECT_EQ(exitCodeForError(OutputError("disk full")), 2);
    EXPECT_EQ(exitCodeForError(ParseError(3, "garbage")), 3);
    EXPECT_EQ(exitCodeForError(NoTransitionFound("no dark run")), 4);
    EXPECT_EQ(exitCodeForError(OutOfCalibrationRange(20.0, 1.0, 11.0)), 5);
    EXPECT_EQ(exitCodeForError(CalibrationError("one point")), 6);
}

TEST(LevelErrorsTest, UnknownExceptionsMapToGenericFailure)
{
    EXPECT_EQ(exitCodeForError(std::runtime_error("boom")), 7);
    EXPECT_EQ(exitCodeForError(TankLevelError("base")), 7);
}

TEST(LevelErrorsTest, ErrorsCarryDiagnosticContext)
{
    ParseError parse(12, "0,11: oops");
    EXPECT_EQ(parse.lineNumber(), 12u);
    EXPECT_EQ(parse.line(), "0,11: oops");
    EXPECT_NE(std::string(parse.what()).find("12"), std::string::npos);

    OutOfCalibrationRange range(20.0, 1.0, 11.0);
    EXPECT_DOUBLE_EQ(range.pixel(), 20.0);
    EXPECT_NE(std::string(range.what()).find("20"), std::string::npos);
}
