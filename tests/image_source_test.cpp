#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>
#include "image_source.hpp"

static bool fileExists(const std::string &path)
{
    return access(path.c_str(), F_OK) == 0;
}

TEST(ImageSourceTest, CropGeometryUsesStripPlacement)
{
    StripGeometry geometry;
    EXPECT_EQ(cropGeometry(geometry), "60x480+236+0");

    geometry.strip_width = 40;
    geometry.image_height = 720;
    geometry.strip_offset = 12;
    EXPECT_EQ(cropGeometry(geometry), "40x720+12+0");
}

TEST(ImageSourceTest, SnapshotUrlCarriesCredentialsAndTimestamp)
{
    CameraConfig camera{"192.168.1.20", "admin", "secret"};
    EXPECT_EQ(snapshotUrl(camera, 1425211200),
              "http://192.168.1.20/snapshot.cgi?user=admin&pwd=secret&1425211200");
}

TEST(ImageSourceTest, ShellQuoteEscapesSingleQuotes)
{
    EXPECT_EQ(shellQuote("plain"), "'plain'");
    EXPECT_EQ(shellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(shellQuote("a b;rm"), "'a b;rm'");
}

TEST(ImageSourceTest, RunCommandReportsExitCodeAndOutput)
{
    std::string output;
    EXPECT_EQ(runCommand({"sh", "-c", "echo hello; echo oops 1>&2; exit 3"}, output), 3);
    EXPECT_EQ(output, "hello\noops\n");

    EXPECT_EQ(runCommand({"echo", "it's fine"}, output), 0);
    EXPECT_EQ(output, "it's fine\n");
}

TEST(ImageSourceTest, TempFileIsRemovedUnlessKept)
{
    std::string removed_path;
    {
        TempFile temp(".txt");
        removed_path = temp.path();
        EXPECT_TRUE(fileExists(removed_path));
        EXPECT_EQ(removed_path.substr(removed_path.size() - 4), ".txt");
    }
    EXPECT_FALSE(fileExists(removed_path));

    std::string kept_path;
    {
        TempFile temp(".jpg");
        temp.keep();
        kept_path = temp.path();
    }
    EXPECT_TRUE(fileExists(kept_path));
    std::remove(kept_path.c_str());
}
