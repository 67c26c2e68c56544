/**
 * SXCV
 *
 * Small fixed images and convolution masks for testing and exercises
 */

#pragma once
#include <string>
#include "opencv2/opencv.hpp"

namespace sxcv
{

// The 10 x 9 arrowhead image discussed in the software chapter of the lecture notes
cv::Mat arrowhead();

// A 13 x 10 low-contrast test image whose pixels are all in the range 10 to 15, for
// trying out histograms, contrast stretching, thresholding and morphology
cv::Mat testimage();

// One of the commonly-used convolution masks as an int32 Mat:
//   blur3      3 x 3 all ones
//   blur5      5 x 5 all ones
//   laplacian  3 x 3 ones with -1 at the centre
// Throws UnsupportedNameError for any other name.
cv::Mat create_mask(const std::string &name);

} // namespace sxcv
