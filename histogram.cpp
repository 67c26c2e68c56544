/**
 * SXCV
 *
 * Forming and plotting histograms of grey levels
 *
 * The plot imitates a matplotlib bar chart: white background, light grid,
 * bars 0.8 of a bin wide centred on their x values.
 */

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include "display.hpp"
#include "errors.hpp"
#include "histogram.hpp"
#include "inspect.hpp"

namespace sxcv
{

// canvas size and margins around the plot area, in pixels
static const int PLOT_WIDTH = 640;
static const int PLOT_HEIGHT = 480;
static const int MARGIN_LEFT = 70;
static const int MARGIN_RIGHT = 20;
static const int MARGIN_TOP = 40;
static const int MARGIN_BOTTOM = 50;
static const int GRID_LINES = 5;

// BGR value of a named colour
static cv::Scalar colour_value(const std::string &name)
{
    if (name == "blue")
        return cv::Scalar(255, 0, 0);
    if (name == "green")
        return cv::Scalar(0, 128, 0);
    if (name == "red")
        return cv::Scalar(0, 0, 255);
    if (name == "grey" || name == "gray")
        return cv::Scalar(128, 128, 128);
    if (name == "black")
        return cv::Scalar(0, 0, 0);
    if (name == "cyan")
        return cv::Scalar(255, 255, 0);
    if (name == "magenta")
        return cv::Scalar(255, 0, 255);
    if (name == "yellow")
        return cv::Scalar(0, 255, 255);
    if (name == "orange")
        return cv::Scalar(0, 165, 255);
    throw UnsupportedNameError("colour", name);
}

Histogram compute_histogram(const cv::Mat &im, int bins)
{
    ImageShape shape = shape_of(im);
    if (shape.rank != 2 && shape.rank != 3)
        throw InvalidShapeError(shape.rank);
    if (im.dims != 2)
        throw std::invalid_argument("compute_histogram needs a 2-D Mat");

    Histogram h;
    h.x.create(1, bins, CV_32F);
    for (int i = 0; i < bins; i++)
        h.x.at<float>(0, i) = (float)i * 256.0f / bins;

    int nc = im.channels();
    h.y.create(nc, bins, CV_32F);
    float range[] = {0, 256};
    const float *ranges[] = {range};
    for (int c = 0; c < nc; c++)
    {
        cv::Mat counts; // bins x 1
        cv::calcHist(&im, 1, &c, cv::Mat(), counts, 1, &bins, ranges);
        cv::Mat row = counts.reshape(1, 1);
        row.copyTo(h.y.row(c));
    }
    return h;
}

cv::Mat render_histogram(const cv::Mat &x, const cv::Mat &y, const std::string &title,
                         const std::vector<std::string> &colours)
{
    int n = (int)x.total();
    if (n == 0)
        throw std::invalid_argument("histogram has no x values");

    // work in doubles, one row per band
    cv::Mat xs, ys;
    x.reshape(1, 1).convertTo(xs, CV_64F);
    if ((y.rows == 1 || y.cols == 1) && (int)y.total() == n)
        y.reshape(1, 1).convertTo(ys, CV_64F);
    else if (y.cols == n)
        y.convertTo(ys, CV_64F);
    else
        throw std::invalid_argument("histogram x and y lengths differ");

    int bands = ys.rows;
    std::vector<cv::Scalar> fills;
    if (bands == 1)
        fills.push_back(colour_value("grey"));
    else
    {
        if (bands > (int)colours.size())
            throw std::invalid_argument("more histogram bands than colours");
        for (int c = 0; c < bands; c++)
            fills.push_back(colour_value(colours[c]));
    }

    double ymax;
    cv::minMaxLoc(ys, nullptr, &ymax);
    if (ymax <= 0)
        ymax = 1;

    cv::Mat canvas(PLOT_HEIGHT, PLOT_WIDTH, CV_8UC3, cv::Scalar(255, 255, 255));
    int left = MARGIN_LEFT;
    int right = PLOT_WIDTH - MARGIN_RIGHT;
    int top = MARGIN_TOP;
    int bottom = PLOT_HEIGHT - MARGIN_BOTTOM;
    double xscale = (right - left) / (double)n; // x limits are [0, n]
    double yscale = (bottom - top) / ymax;

    // grid and tick labels
    char label[32];
    for (int i = 0; i <= GRID_LINES; i++)
    {
        int gx = left + (int)((right - left) * i / (double)GRID_LINES);
        int gy = bottom - (int)((bottom - top) * i / (double)GRID_LINES);
        cv::line(canvas, cv::Point(gx, top), cv::Point(gx, bottom), cv::Scalar(220, 220, 220), 1);
        cv::line(canvas, cv::Point(left, gy), cv::Point(right, gy), cv::Scalar(220, 220, 220), 1);

        snprintf(label, sizeof(label), "%g", n * i / (double)GRID_LINES);
        cv::putText(canvas, label, cv::Point(gx - 10, bottom + 18),
                    cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(0, 0, 0), 1);
        snprintf(label, sizeof(label), "%g", ymax * i / GRID_LINES);
        cv::putText(canvas, label, cv::Point(5, gy + 4),
                    cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(0, 0, 0), 1);
    }

    // the bars; later bands are drawn over earlier ones
    for (int c = 0; c < bands; c++)
    {
        for (int i = 0; i < n; i++)
        {
            double xv = xs.at<double>(0, i);
            double yv = ys.at<double>(c, i);
            if (yv <= 0)
                continue;
            int x0 = left + (int)((xv - 0.4) * xscale);
            int x1 = left + (int)((xv + 0.4) * xscale);
            if (x1 <= x0)
                x1 = x0 + 1; // at least a pixel wide
            x0 = std::max(x0, left);
            x1 = std::min(x1, right);
            int y0 = bottom - (int)(yv * yscale);
            if (x1 > x0)
                cv::rectangle(canvas, cv::Point(x0, y0), cv::Point(x1 - 1, bottom), fills[c], cv::FILLED);
        }
    }

    // axes, labels and title
    cv::rectangle(canvas, cv::Point(left, top), cv::Point(right, bottom), cv::Scalar(0, 0, 0), 1);
    cv::putText(canvas, "grey level", cv::Point((left + right) / 2 - 40, PLOT_HEIGHT - 12),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 0), 1);
    cv::putText(canvas, "frequency", cv::Point(5, top - 8),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 0), 1);
    cv::putText(canvas, title, cv::Point(left + 100, top - 12),
                cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0, 0, 0), 1);

    return canvas;
}

void plot_histogram(const cv::Mat &x, const cv::Mat &y, const std::string &title,
                    const std::vector<std::string> &colours)
{
    cv::Mat canvas = render_histogram(x, y, title, colours);
    dispatcher().display(canvas, title, 0, true);
}

} // namespace sxcv
