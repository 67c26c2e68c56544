/**
 * SXCV
 *
 * Describing images and printing out their pixel values
 */

#include <algorithm>
#include <cstdio>
#include "errors.hpp"
#include "inspect.hpp"

namespace sxcv
{

ImageShape shape_of(const cv::Mat &im)
{
    ImageShape shape = {0, 0, 0, 0};
    if (im.empty())
        return shape;

    shape.rows = im.size[0];
    shape.cols = im.size[1];
    if (im.dims == 2)
    {
        // interleaved channels are the last axis
        shape.channels = im.channels() > 1 ? im.channels() : 0;
        shape.rank = im.channels() > 1 ? 3 : 2;
    }
    else if (im.dims == 3 && im.channels() == 1)
    {
        // a 3-D single-channel Mat keeps its channels along the third axis
        shape.channels = im.size[2];
        shape.rank = 3;
    }
    else
    {
        shape.rank = im.dims + (im.channels() > 1 ? 1 : 0);
    }
    return shape;
}

std::string dtype_name(const cv::Mat &im)
{
    switch (im.depth())
    {
    case CV_8U:
        return "uint8";
    case CV_8S:
        return "int8";
    case CV_16U:
        return "uint16";
    case CV_16S:
        return "int16";
    case CV_32S:
        return "int32";
    case CV_32F:
        return "float32";
    case CV_64F:
        return "float64";
    case CV_16F:
        return "float16";
    }
    return "unknown";
}

Span clip_span(int center, int requested, int extent)
{
    Span span;
    requested = std::max(requested, 0);
    span.lo = std::min(std::max(center - requested / 2, 0), extent);
    span.hi = span.lo + std::min(requested, extent - span.lo);
    span.size = span.hi - span.lo;
    return span;
}

// Value of sample (y, x, c) as a double, whatever the depth and layout
static double sample(const cv::Mat &im, int y, int x, int c)
{
    const uchar *p;
    int offset;
    if (im.dims == 3)
    {
        int idx[3] = {y, x, c};
        p = im.ptr(idx);
        offset = 0;
    }
    else
    {
        p = im.ptr(y);
        offset = x * im.channels() + c;
    }

    switch (im.depth())
    {
    case CV_8U:
        return p[offset];
    case CV_8S:
        return ((const schar *)p)[offset];
    case CV_16U:
        return ((const ushort *)p)[offset];
    case CV_16S:
        return ((const short *)p)[offset];
    case CV_32S:
        return ((const int *)p)[offset];
    case CV_32F:
        return ((const float *)p)[offset];
    case CV_64F:
        return ((const double *)p)[offset];
    }
    return 0.0;
}

std::string describe(const cv::Mat &im, const std::string &title)
{
    ImageShape shape = shape_of(im);
    char channels[64];
    if (shape.rank == 2)
        snprintf(channels, sizeof(channels), "is monochrome");
    else if (shape.rank == 3)
        snprintf(channels, sizeof(channels), "has %d channels", shape.channels);
    else
        throw InvalidShapeError(shape.rank);

    char size[128];
    snprintf(size, sizeof(size), " of size %d rows x %d columns with ", shape.rows, shape.cols);
    return title + " " + channels + size + dtype_name(im) + " pixels.";
}

std::string examine(const cv::Mat &im, int aty, int atx, int rows, int cols, const std::string &title)
{
    ImageShape shape = shape_of(im);
    if (shape.rank != 2 && shape.rank != 3)
        throw InvalidShapeError(shape.rank);

    int ny = shape.rows;
    int nx = shape.cols;
    int nc = shape.channels;

    // half floats have no C++ type of their own to read them through
    cv::Mat pixels = im;
    if (im.depth() == CV_16F)
        im.convertTo(pixels, CV_32F);

    // work out the default values of arguments
    if (aty < 0)
        aty = ny / 2;
    if (atx < 0)
        atx = nx / 2;
    if (rows < 0)
        rows = ny;
    if (cols < 0)
        cols = nx;

    // work out the region to display
    Span ys = clip_span(aty, rows, ny);
    Span xs = clip_span(atx, cols, nx);

    char buf[128];
    std::string text;
    if (!title.empty())
        text += title + "\n";

    char channels[32];
    if (nc == 0)
        snprintf(channels, sizeof(channels), "monochrome");
    else
        snprintf(channels, sizeof(channels), "%d-channel", nc);
    snprintf(buf, sizeof(buf), "[%d x %d region of %d x %d-pixel %s image at (%d,%d)]:\n",
             ys.size, xs.size, ny, nx, channels, aty, atx);
    text += buf;

    // header line of column numbers with a rule underneath
    const std::string start = "       ";
    std::string line;
    for (int x = xs.lo; x < xs.hi; x++)
    {
        snprintf(buf, sizeof(buf), "%4d", x);
        line += buf;
    }
    text += start + line + "\n" + start + std::string(line.size(), '-') + "\n";

    // one line per row for monochrome, one line per channel of each row otherwise
    for (int y = ys.lo; y < ys.hi; y++)
    {
        snprintf(buf, sizeof(buf), "%5d| ", y);
        text += buf;
        int bands = (nc == 0) ? 1 : nc;
        for (int c = 0; c < bands; c++)
        {
            if (c > 0)
                text += start.substr(0, start.size() - 2) + "| ";
            for (int x = xs.lo; x < xs.hi; x++)
            {
                snprintf(buf, sizeof(buf), "%4d", (int)sample(pixels, y, x, c));
                text += buf;
            }
            text += "\n";
        }
    }

    return text;
}

} // namespace sxcv
