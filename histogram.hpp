/**
 * SXCV
 *
 * Forming and plotting histograms of grey levels
 */

#pragma once
#include <string>
#include <vector>
#include "opencv2/opencv.hpp"

namespace sxcv
{

struct Histogram
{
    cv::Mat x; // 1 x bins float32, the grey levels
    cv::Mat y; // channels x bins float32, the frequencies (1 row for monochrome)
};

// Histogram of each channel of an 8-bit image over the grey levels [0, 256).
// Throws InvalidShapeError for images that are not rank 2 or 3, and
// std::invalid_argument for 3-D Mats.
Histogram compute_histogram(const cv::Mat &im, int bins = 256);

// Draws a bar chart of `y` against `x` onto an 8-bit colour canvas.  `y` is
// either a single row (the histogram of a monochrome image), drawn in grey, or
// has one row per colour band, drawn in `colours[band]`.
cv::Mat render_histogram(const cv::Mat &x, const cv::Mat &y, const std::string &title,
                         const std::vector<std::string> &colours = {"blue", "green", "red"});

// Renders the histogram and shows it in a window, waiting for a key press
void plot_histogram(const cv::Mat &x, const cv::Mat &y, const std::string &title,
                    const std::vector<std::string> &colours = {"blue", "green", "red"});

} // namespace sxcv
