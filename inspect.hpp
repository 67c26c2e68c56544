/**
 * SXCV
 *
 * Describing images and printing out their pixel values
 *
 * A monochrome image in OpenCV is a single-channel 2-D Mat and a colour one
 * has several interleaved channels, so code that iterates over pixels has to
 * handle the two cases separately.  examine() shows how.
 */

#pragma once
#include <string>
#include "opencv2/opencv.hpp"

namespace sxcv
{

// Shape of an image the way numpy would report it
struct ImageShape
{
    int rows;
    int cols;
    int channels; // 0 for a monochrome image
    int rank;     // 2 = monochrome, 3 = multi-channel, anything else is unusable
};

ImageShape shape_of(const cv::Mat &im);

// numpy-style name of the sample type, e.g. "uint8"
std::string dtype_name(const cv::Mat &im);

// Rows or columns of a region after clipping to the image
struct Span
{
    int lo;
    int hi;
    int size; // hi - lo, never negative
};

// Window of `requested` samples centred on `center`, shrunk to fit in [0, extent)
Span clip_span(int center, int requested, int extent);

// One-sentence description of an image, e.g.
//   "This image is monochrome of size 10 rows x 9 columns with uint8 pixels."
// Throws InvalidShapeError if the image is not rank 2 or 3.
std::string describe(const cv::Mat &im, const std::string &title = "Image");

/*
  Returns the pixel values of a region of an image in a form suitable for printing out.

  const cv::Mat &im         image to be examined
  int aty, atx              middle row and column of the region (negative: middle of the image)
  int rows, cols            number of rows and columns to show (negative: the whole image)
  const std::string &title  line printed above the region (empty: none)

  For create_mask("laplacian") the output is

  [3 x 3 region of 3 x 3-pixel monochrome image at (1,1)]:
            0   1   2
         ------------
      0|    1   1   1
      1|    1  -1   1
      2|    1   1   1

  Throws InvalidShapeError if the image is not rank 2 or 3.
*/
std::string examine(const cv::Mat &im, int aty = -1, int atx = -1, int rows = -1, int cols = -1,
                    const std::string &title = "");

} // namespace sxcv
