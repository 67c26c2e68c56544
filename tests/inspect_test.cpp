/**
 * SXCV
 *
 * Tests for describe() and examine()
 */

#include <climits>
#include <gtest/gtest.h>
#include "errors.hpp"
#include "fixtures.hpp"
#include "inspect.hpp"

TEST(DescribeTest, MonochromeArrowhead)
{
    EXPECT_EQ(sxcv::describe(sxcv::arrowhead(), "This image"),
              "This image is monochrome of size 10 rows x 9 columns with uint8 pixels.");
}

TEST(DescribeTest, DefaultTitleAndMaskType)
{
    EXPECT_EQ(sxcv::describe(sxcv::create_mask("blur5")),
              "Image is monochrome of size 5 rows x 5 columns with int32 pixels.");
}

TEST(DescribeTest, MultiChannel)
{
    cv::Mat colour(4, 5, CV_8UC3, cv::Scalar(0, 0, 0));
    EXPECT_EQ(sxcv::describe(colour, "Colour"),
              "Colour has 3 channels of size 4 rows x 5 columns with uint8 pixels.");

    cv::Mat floats(7, 2, CV_32FC2);
    EXPECT_EQ(sxcv::describe(floats, "F"),
              "F has 2 channels of size 7 rows x 2 columns with float32 pixels.");
}

TEST(DescribeTest, ThreeDimensionalSingleChannelMat)
{
    int sizes[] = {2, 3, 4};
    cv::Mat cube(3, sizes, CV_16U, cv::Scalar(0));
    EXPECT_EQ(sxcv::describe(cube, "Cube"),
              "Cube has 4 channels of size 2 rows x 3 columns with uint16 pixels.");
}

TEST(DescribeTest, RejectsOtherRanks)
{
    EXPECT_THROW(sxcv::describe(cv::Mat()), sxcv::InvalidShapeError);

    int sizes[] = {2, 3, 4};
    cv::Mat cube(3, sizes, CV_8UC3);
    try
    {
        sxcv::describe(cube);
        FAIL() << "expected InvalidShapeError";
    }
    catch (const sxcv::InvalidShapeError &e)
    {
        EXPECT_EQ(e.rank(), 4);
        EXPECT_STREQ(e.what(), "I have a '4'-dimensional image!");
    }

    int sizes4[] = {2, 2, 2, 2};
    cv::Mat hyper(4, sizes4, CV_8U);
    EXPECT_THROW(sxcv::describe(hyper), sxcv::InvalidShapeError);
}

TEST(ClipSpanTest, CentredWhenThereIsRoom)
{
    sxcv::Span s = sxcv::clip_span(6, 3, 13);
    EXPECT_EQ(s.lo, 5);
    EXPECT_EQ(s.hi, 8);
    EXPECT_EQ(s.size, 3);
}

TEST(ClipSpanTest, ShrinksAtTheEdges)
{
    sxcv::Span low = sxcv::clip_span(0, 5, 13);
    EXPECT_EQ(low.lo, 0);
    EXPECT_EQ(low.size, 5);

    sxcv::Span high = sxcv::clip_span(12, 5, 13);
    EXPECT_EQ(high.lo, 10);
    EXPECT_EQ(high.hi, 13);
    EXPECT_EQ(high.size, 3);

    sxcv::Span wide = sxcv::clip_span(4, 100, 9);
    EXPECT_EQ(wide.lo, 0);
    EXPECT_EQ(wide.hi, 9);
}

TEST(ClipSpanTest, NeverExceedsTheImage)
{
    for (int extent = 0; extent <= 12; extent++)
        for (int center = -3; center <= extent + 3; center++)
            for (int requested = 0; requested <= 2 * extent + 2; requested++)
            {
                sxcv::Span s = sxcv::clip_span(center, requested, extent);
                EXPECT_GE(s.lo, 0);
                EXPECT_LE(s.hi, extent);
                EXPECT_GE(s.size, 0);
                EXPECT_LE(s.size, requested);
                EXPECT_EQ(s.size, s.hi - s.lo);
                if (center - requested / 2 >= 0 && center - requested / 2 + requested <= extent)
                {
                    EXPECT_EQ(s.lo, center - requested / 2);
                    EXPECT_EQ(s.size, requested);
                }
            }
}

TEST(ExamineTest, LaplacianMask)
{
    std::string expected =
        "[3 x 3 region of 3 x 3-pixel monochrome image at (1,1)]:\n"
        "          0   1   2\n"
        "       ------------\n"
        "    0|    1   1   1\n"
        "    1|    1  -1   1\n"
        "    2|    1   1   1\n";
    EXPECT_EQ(sxcv::examine(sxcv::create_mask("laplacian")), expected);
}

TEST(ExamineTest, TitleLineComesFirst)
{
    std::string text = sxcv::examine(sxcv::create_mask("blur3"), -1, -1, -1, -1, "blur3");
    EXPECT_EQ(text.substr(0, 6), "blur3\n");
}

TEST(ExamineTest, MultiChannelRowsHaveALinePerChannel)
{
    cv::Mat im(2, 2, CV_8UC3, cv::Scalar(1, 2, 3));
    std::string expected =
        "[2 x 2 region of 2 x 2-pixel 3-channel image at (1,1)]:\n"
        "          0   1\n"
        "       --------\n"
        "    0|    1   1\n"
        "     |    2   2\n"
        "     |    3   3\n"
        "    1|    1   1\n"
        "     |    2   2\n"
        "     |    3   3\n";
    EXPECT_EQ(sxcv::examine(im), expected);
}

TEST(ExamineTest, RegionIsClippedAtTheCorner)
{
    std::string text = sxcv::examine(sxcv::testimage(), 12, 9, 5, 5);
    std::string expected =
        "[3 x 3 region of 13 x 10-pixel monochrome image at (12,9)]:\n"
        "          7   8   9\n"
        "       ------------\n"
        "   10|   10  10  10\n"
        "   11|   10  10  12\n"
        "   12|   11  10  11\n";
    EXPECT_EQ(text, expected);
}

TEST(ExamineTest, CentredRegion)
{
    std::string text = sxcv::examine(sxcv::arrowhead(), 3, 4, 3, 3);
    std::string expected =
        "[3 x 3 region of 10 x 9-pixel monochrome image at (3,4)]:\n"
        "          3   4   5\n"
        "       ------------\n"
        "    2|  255 255 255\n"
        "    3|  255 255 255\n"
        "    4|    0 255   0\n";
    EXPECT_EQ(text, expected);
}

TEST(ExamineTest, RequestBeyondTheImageIsEmptyNotAnError)
{
    std::string text = sxcv::examine(sxcv::arrowhead(), 40, 40, 3, 3);
    EXPECT_EQ(text.substr(0, text.find('\n')),
              "[0 x 0 region of 10 x 9-pixel monochrome image at (40,40)]:");
}

TEST(ExamineTest, NegativeValuesStayAligned)
{
    cv::Mat im = (cv::Mat_<int>(1, 2) << -128, 7);
    std::string text = sxcv::examine(im);
    EXPECT_NE(text.find("    0| -128   7\n"), std::string::npos);
}

TEST(ClipSpanTest, HugeRequestsDoNotOverflow)
{
    sxcv::Span far = sxcv::clip_span(INT_MAX, INT_MAX, 10);
    EXPECT_EQ(far.lo, 10);
    EXPECT_EQ(far.hi, 10);
    EXPECT_EQ(far.size, 0);

    sxcv::Span whole = sxcv::clip_span(5, INT_MAX, 10);
    EXPECT_EQ(whole.lo, 0);
    EXPECT_EQ(whole.hi, 10);

    EXPECT_EQ(sxcv::clip_span(3, -4, 10).size, 0);
}

TEST(ExamineTest, FloatSamplesAreTruncated)
{
    cv::Mat im = (cv::Mat_<float>(1, 2) << -1.7f, 2.9f);
    std::string text = sxcv::examine(im);
    EXPECT_NE(text.find("    0|   -1   2\n"), std::string::npos);
}

TEST(ExamineTest, HalfFloatSamplesAreTruncated)
{
    cv::Mat floats = (cv::Mat_<float>(1, 2) << -1.7f, 2.9f);
    cv::Mat halves;
    floats.convertTo(halves, CV_16F);
    std::string text = sxcv::examine(halves);
    EXPECT_NE(text.find("    0|   -1   2\n"), std::string::npos);
}

TEST(ExamineTest, ThreeDimensionalMatHasChannelsLast)
{
    int sizes[] = {2, 2, 2};
    cv::Mat cube(3, sizes, CV_16U);
    for (int i = 0; i < 2; i++)
        for (int j = 0; j < 2; j++)
            for (int k = 0; k < 2; k++)
                cube.at<ushort>(i, j, k) = (ushort)(i * 100 + j * 10 + k);

    std::string expected =
        "[2 x 2 region of 2 x 2-pixel 2-channel image at (1,1)]:\n"
        "          0   1\n"
        "       --------\n"
        "    0|    0  10\n"
        "     |    1  11\n"
        "    1|  100 110\n"
        "     |  101 111\n";
    EXPECT_EQ(sxcv::examine(cube), expected);
}
