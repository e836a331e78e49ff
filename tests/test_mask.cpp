/**
 * @file test_mask.cpp
 * @brief Point-in-polygon coverage, mask shape and crop geometry
 */

#include "test_helpers.h"

#include <gtest/gtest.h>

#include <cmath>

namespace
{

RegionPath triangle()
{
    return RegionPath({{20, 10}, {90, 30}, {30, 80}});
}

// Pentagram drawn in one stroke; the inner pentagon is wound twice.
RegionPath star()
{
    std::vector<cv::Point> pts;
    const double cx = 100, cy = 100, r = 80;
    for (int i = 0; i < 5; ++i)
    {
        const double a = -CV_PI / 2 + i * 4 * CV_PI / 5;
        pts.emplace_back(static_cast<int>(std::lround(cx + r * std::cos(a))),
                         static_cast<int>(std::lround(cy + r * std::sin(a))));
    }
    return RegionPath(pts);
}

// Bow tie: the two lobes wind in opposite directions.
RegionPath bowTie()
{
    return RegionPath({{10, 10}, {110, 90}, {110, 10}, {10, 90}});
}

cv::Mat canvas()
{
    cv::Mat img(200, 220, CV_8UC3);
    cv::randu(img, cv::Scalar(1, 1, 1), cv::Scalar(255, 255, 255));
    return img;
}

void expectOutsideIsEmpty(const cv::Mat& image, const RegionPath& path, FillRule rule)
{
    MaskSettings s;
    s.fillRule = rule;
    const MaskedImage m = applyMask(image, path, s);
    const cv::Rect box = path.boundingBox() & cv::Rect(0, 0, image.cols, image.rows);
    ASSERT_FALSE(m.empty());
    ASSERT_EQ(m.bgra.size(), box.size());
    ASSERT_FALSE(m.ellipseFallback);

    const PolygonCoverage cov(path.points(), rule);
    for (int y = 0; y < m.bgra.rows; ++y)
    {
        for (int x = 0; x < m.bgra.cols; ++x)
        {
            const cv::Vec4b px = m.bgra.at<cv::Vec4b>(y, x);
            const cv::Point abs(box.x + x, box.y + y);
            if (cov.contains(abs))
            {
                const cv::Vec3b src = image.at<cv::Vec3b>(abs);
                ASSERT_EQ(px, cv::Vec4b(src[0], src[1], src[2], 255)) << "at " << abs;
            }
            else
            {
                ASSERT_EQ(px, cv::Vec4b(0, 0, 0, 0)) << "at " << abs;
            }
        }
    }
}

} // namespace

class PolygonCoverageTest : public ::testing::Test
{
};

TEST_F(PolygonCoverageTest, SquareInteriorBoundaryExterior)
{
    const PolygonCoverage cov({{0, 0}, {10, 0}, {10, 10}, {0, 10}}, FillRule::EvenOdd);

    EXPECT_TRUE(cov.contains({5, 5}));
    EXPECT_TRUE(cov.contains({0, 5}));
    EXPECT_TRUE(cov.contains({10, 10}));
    EXPECT_FALSE(cov.contains({11, 5}));
    EXPECT_FALSE(cov.contains({-1, -1}));
}

TEST_F(PolygonCoverageTest, StarCentreDependsOnFillRule)
{
    const RegionPath s = star();

    EXPECT_FALSE(PolygonCoverage(s.points(), FillRule::EvenOdd).contains({100, 100}));
    EXPECT_TRUE(PolygonCoverage(s.points(), FillRule::NonZero).contains({100, 100}));
}

TEST_F(PolygonCoverageTest, BowTieLobesInsideForBothRules)
{
    const RegionPath b = bowTie();
    for (FillRule rule : {FillRule::EvenOdd, FillRule::NonZero})
    {
        const PolygonCoverage cov(b.points(), rule);
        EXPECT_TRUE(cov.contains({20, 50}));
        EXPECT_TRUE(cov.contains({100, 50}));
        EXPECT_FALSE(cov.contains({60, 20}));
    }
}

TEST_F(PolygonCoverageTest, RasterizeAgreesWithContains)
{
    const RegionPath s = star();
    const PolygonCoverage cov(s.points(), FillRule::EvenOdd);
    const cv::Rect area = s.boundingBox();
    const cv::Mat mask = cov.rasterize(area);

    for (int y = 0; y < mask.rows; y += 3)
    {
        for (int x = 0; x < mask.cols; x += 3)
        {
            ASSERT_EQ(mask.at<uchar>(y, x) != 0, cov.contains({area.x + x, area.y + y}));
        }
    }
}

TEST_F(PolygonCoverageTest, EveryVertexIsCovered)
{
    for (const RegionPath& p : {triangle(), star(), bowTie()})
    {
        for (FillRule rule : {FillRule::EvenOdd, FillRule::NonZero})
        {
            const PolygonCoverage cov(p.points(), rule);
            const cv::Rect box = p.boundingBox();
            const cv::Mat mask = cov.rasterize(box);
            for (const cv::Point& v : p.points())
            {
                EXPECT_TRUE(cov.contains(v));
                EXPECT_EQ(mask.at<uchar>(v.y - box.y, v.x - box.x), 255);
            }
        }
    }
}

class MaskCropTest : public ::testing::Test
{
protected:
    cv::Mat image = canvas();
};

TEST_F(MaskCropTest, TriangleOutsideIsEmpty)
{
    expectOutsideIsEmpty(image, triangle(), FillRule::EvenOdd);
}

TEST_F(MaskCropTest, StarOutsideIsEmptyForBothRules)
{
    expectOutsideIsEmpty(image, star(), FillRule::EvenOdd);
    expectOutsideIsEmpty(image, star(), FillRule::NonZero);
}

TEST_F(MaskCropTest, SelfIntersectingLoopOutsideIsEmpty)
{
    expectOutsideIsEmpty(image, bowTie(), FillRule::EvenOdd);
}

TEST_F(MaskCropTest, BoxIsClampedToImage)
{
    const RegionPath p({{-50, -20}, {100, 10}, {60, 400}});
    const MaskedImage m = applyMask(image, p, MaskSettings{});

    ASSERT_FALSE(m.empty());
    EXPECT_EQ(m.bounds, cv::Rect(0, 0, 101, 200));
    EXPECT_EQ(m.bgra.size(), m.bounds.size());
}

TEST_F(MaskCropTest, SelectionOffImageGivesEmptyResult)
{
    const RegionPath p({{500, 500}, {600, 500}, {550, 600}});
    EXPECT_TRUE(applyMask(image, p, MaskSettings{}).empty());
}

TEST_F(MaskCropTest, SliverFallsBackToEllipse)
{
    const RegionPath sliver({{10, 10}, {200, 50}, {11, 11}});
    const MaskedImage m = applyMask(image, sliver, MaskSettings{});

    ASSERT_FALSE(m.empty());
    EXPECT_TRUE(m.ellipseFallback);
    EXPECT_EQ(m.coverage.at<uchar>(20, 95), 255);      // bbox centre
    EXPECT_EQ(m.coverage.at<uchar>(0, 0), 255);        // vertex kept
    EXPECT_EQ(m.coverage.at<uchar>(40, 0), 0);         // far corner stays empty
    EXPECT_GT(cv::countNonZero(m.coverage), 1000);
}

TEST_F(MaskCropTest, StraightLineFillsItsThinBox)
{
    const RegionPath line({{10, 10}, {60, 10}, {110, 11}});
    const MaskedImage m = applyMask(image, line, MaskSettings{});

    ASSERT_FALSE(m.empty());
    EXPECT_TRUE(m.ellipseFallback);
    EXPECT_EQ(cv::countNonZero(m.coverage), m.bounds.area());
}

TEST_F(MaskCropTest, GrayInputIsAccepted)
{
    cv::Mat gray(50, 50, CV_8UC1, cv::Scalar(77));
    const MaskedImage m = applyMask(gray, RegionPath::fromRect({5, 5, 20, 20}), MaskSettings{});

    ASSERT_FALSE(m.empty());
    EXPECT_EQ(m.bgra.type(), CV_8UC4);
    EXPECT_EQ(m.bgra.at<cv::Vec4b>(10, 10), cv::Vec4b(77, 77, 77, 255));
}
