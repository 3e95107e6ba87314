#include <gtest/gtest.h>
#include "BezIO.hxx"
#include "CurveArena.hxx"
#include "CurveIntersector.hxx"
#include <cstdio>
#include <cstring>
#include <stdexcept>

static void writeText(const char* path, const char* txt) {
    FILE* f = std::fopen(path, "wb");
    ASSERT_NE(f, nullptr);
    std::fwrite(txt, 1, std::strlen(txt), f);
    std::fclose(f);
}

TEST(BezIO, WriteAndReadRoundTrip) {
    std::vector<Bezier> curves;
    curves.emplace_back(std::vector<Bezier::Point>{ {0.0, 0.0}, {1.0, 0.0} });
    curves.emplace_back(std::vector<Bezier::Point>{ {0.1, 0.2}, {0.5, 1.0 / 3.0}, {1.0, -2.5e-7} });
    const char* path = "io_tmp.bez";
    std::string err;
    ASSERT_TRUE(BezIO::writeFile(path, curves, &err)) << err;

    // Append a comment and ensure parser ignores it
    {
        FILE* f = std::fopen(path, "a");
        ASSERT_NE(f, nullptr);
        std::fputs("* trailing comment\n", f);
        std::fclose(f);
    }

    std::vector<Bezier> readCurves;
    ASSERT_TRUE(BezIO::readFile(path, readCurves, &err)) << err;
    ASSERT_EQ(readCurves.size(), curves.size());
    EXPECT_EQ(readCurves[0].degree(), 1);
    EXPECT_EQ(readCurves[1].degree(), 2);
    // max_digits10 output reads back bit for bit
    EXPECT_EQ(readCurves[1].controlPoints(), curves[1].controlPoints());
}

TEST(BezIO, CommentsAndSplitCtrlLines) {
    const char* fname = "io_mix.bez";
    writeText(fname,
        "* a cubic given over two ctrl lines and a line without a degree\n"
        "curve degree 3   # S-shaped\n"
        "ctrl 0 -1  1 3\n"
        "ctrl 2 -3  3 1\n"
        "endcurve\n\n"
        "curve\n"
        "ctrl -0.5 0  3.5 0\n"
        "endcurve\n");

    std::vector<Bezier> r;
    std::string err;
    ASSERT_TRUE(BezIO::readFile(fname, r, &err)) << err;
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r[0].degree(), 3);
    EXPECT_EQ(r[0].controlPoints()[2][1], -3.0);
    EXPECT_EQ(r[1].degree(), 1);

    // The file drives a full intersection query
    CurveArena arena;
    CurveHandle a = arena.add(r[0]);
    CurveHandle b = arena.add(r[1]);
    IntersectionStore found;
    ASSERT_EQ(CurveIntersector().allIntersections(arena, a, b, found, &err), IntersectStatus::Success) << err;
    EXPECT_EQ(found.size(), 4u);
}

TEST(BezIO, DegreeMismatchIsAnError) {
    const char* fname = "io_bad_degree.bez";
    writeText(fname,
        "curve degree 2\n"
        "ctrl 0 0  1 1\n"
        "endcurve\n");
    std::vector<Bezier> r;
    std::string err;
    EXPECT_FALSE(BezIO::readFile(fname, r, &err));
    EXPECT_NE(err.find("degree does not match"), std::string::npos) << err;
    EXPECT_THROW(BezIO::readFile(fname, r), std::runtime_error);
}

TEST(BezIO, MalformedBlocks) {
    std::vector<Bezier> r;
    std::string err;

    writeText("io_unterminated.bez", "curve\nctrl 0 0 1 1\n");
    EXPECT_FALSE(BezIO::readFile("io_unterminated.bez", r, &err));
    EXPECT_NE(err.find("unterminated"), std::string::npos) << err;

    writeText("io_odd.bez", "curve\nctrl 0 0 1\nendcurve\n");
    EXPECT_FALSE(BezIO::readFile("io_odd.bez", r, &err));
    EXPECT_NE(err.find("pairs"), std::string::npos) << err;

    writeText("io_single.bez", "curve\nctrl 0 0\nendcurve\n");
    EXPECT_FALSE(BezIO::readFile("io_single.bez", r, &err));
    EXPECT_NE(err.find("invalid curve"), std::string::npos) << err;

    writeText("io_stray.bez", "ctrl 0 0 1 1\n");
    EXPECT_FALSE(BezIO::readFile("io_stray.bez", r, &err));
    EXPECT_TRUE(r.empty());
}

TEST(BezIO, MissingFile) {
    std::vector<Bezier> r;
    std::string err;
    EXPECT_FALSE(BezIO::readFile("does_not_exist_42.bez", r, &err));
    EXPECT_EQ(err, "Could not open bez file for reading");
}
