/**
 * SXCV
 *
 * Small fixed images and convolution masks for testing and exercises
 */

#include "errors.hpp"
#include "fixtures.hpp"

namespace sxcv
{

cv::Mat arrowhead()
{
    static const uchar pixels[10][9] = {
        {0, 0, 0, 0, 0, 0, 0, 0, 0},
        {0, 0, 0, 0, 255, 0, 0, 0, 0},
        {0, 0, 0, 255, 255, 255, 0, 0, 0},
        {0, 0, 255, 255, 255, 255, 255, 0, 0},
        {0, 0, 0, 0, 255, 0, 0, 0, 0},
        {0, 0, 0, 0, 255, 0, 0, 0, 0},
        {0, 0, 0, 0, 255, 0, 0, 0, 0},
        {0, 0, 0, 0, 255, 0, 0, 0, 0},
        {0, 0, 0, 0, 255, 0, 0, 0, 0},
        {0, 0, 0, 0, 0, 0, 0, 0, 0}};

    // clone so the caller owns (and may modify) the pixels
    return cv::Mat(10, 9, CV_8UC1, (void *)pixels).clone();
}

cv::Mat testimage()
{
    static const uchar pixels[13][10] = {
        {10, 12, 11, 11, 12, 11, 10, 12, 11, 12},
        {10, 10, 10, 10, 10, 10, 10, 10, 10, 11},
        {11, 10, 14, 15, 10, 10, 10, 10, 15, 10},
        {10, 10, 14, 15, 10, 10, 10, 10, 10, 10},
        {10, 10, 14, 14, 10, 10, 10, 10, 10, 10},
        {10, 10, 10, 10, 15, 13, 10, 10, 10, 12},
        {12, 10, 10, 10, 14, 13, 10, 15, 10, 10},
        {12, 10, 10, 10, 10, 14, 10, 14, 14, 11},
        {12, 14, 14, 10, 10, 10, 10, 14, 10, 11},
        {10, 13, 14, 10, 10, 10, 15, 15, 10, 12},
        {12, 14, 15, 10, 10, 10, 10, 10, 10, 10},
        {10, 10, 10, 10, 10, 10, 10, 10, 10, 12},
        {11, 10, 11, 10, 12, 12, 11, 11, 10, 11}};

    return cv::Mat(13, 10, CV_8UC1, (void *)pixels).clone();
}

cv::Mat create_mask(const std::string &name)
{
    cv::Mat mask;
    if (name == "blur3")
    {
        mask = cv::Mat::ones(3, 3, CV_32S);
    }
    else if (name == "blur5")
    {
        mask = cv::Mat::ones(5, 5, CV_32S);
    }
    else if (name == "laplacian")
    {
        mask = cv::Mat::ones(3, 3, CV_32S);
        mask.at<int>(1, 1) = -1;
    }
    else
    {
        throw UnsupportedNameError("mask", name);
    }
    return mask;
}

} // namespace sxcv
