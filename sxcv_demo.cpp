/**
 * SXCV
 *
 * Demonstrates the library on an image: describes it, prints its pixels,
 * plots its histogram and shows it when debugging
 *
 * -i <file>   image to load (default: the arrowhead image)
 * -debug      turn on debug mode, as if SXCV contained "debug"
 * -e          print the pixel values around the centre of the image
 * -h          plot the histogram of the image
 * -m <name>   print one of the convolution masks (blur3, blur5, laplacian)
 */

#include <cstdio>
#include <cstring>
#include "sxcv.hpp"

int main(int argc, char *argv[])
{
    const char *img_filepath = nullptr;
    const char *mask_name = nullptr;
    bool examine_mode = false;
    bool histogram_mode = false;

    sxcv::dispatcher().set_program_name(argv[0]);

    // parse the command-line qualifiers
    for (int i = 1; i < argc; i++)
    {
        if (strcmp(argv[i], "-i") == 0 && i + 1 < argc)
        {
            img_filepath = argv[i + 1];
            i++; // skip the filename
        }
        else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc)
        {
            mask_name = argv[i + 1];
            i++;
        }
        else if (strcmp(argv[i], "-debug") == 0)
            sxcv::debug_on();
        else if (strcmp(argv[i], "-e") == 0)
            examine_mode = true;
        else if (strcmp(argv[i], "-h") == 0)
            histogram_mode = true;
        else
        {
            printf("Usage: %s [-i image] [-debug] [-e] [-h] [-m mask]\n", argv[0]);
            return -1;
        }
    }

    printf("sxcv version %s, debugging %s\n", sxcv::version().c_str(), sxcv::debugging() ? "ON" : "OFF");

    try
    {
        cv::Mat src;
        std::string title;
        if (img_filepath)
        {
            src = cv::imread(img_filepath, cv::IMREAD_UNCHANGED);
            if (src.empty())
            {
                printf("Error: Could not load image %s\n", img_filepath);
                return -1;
            }
            title = img_filepath;
        }
        else
        {
            src = sxcv::arrowhead();
            title = "arrowhead";
        }

        printf("%s\n", sxcv::describe(src, title).c_str());

        if (examine_mode)
            printf("%s", sxcv::examine(src, -1, -1, 15, 15).c_str());

        if (mask_name)
        {
            cv::Mat mask = sxcv::create_mask(mask_name);
            printf("%s", sxcv::examine(mask, -1, -1, -1, -1, mask_name).c_str());
        }

        if (histogram_mode)
        {
            sxcv::Histogram h = sxcv::compute_histogram(src);
            sxcv::plot_histogram(h.x, h.y, "Histogram of " + title);
        }

        sxcv::ddisplay(src, title);
    }
    catch (const std::exception &e)
    {
        printf("Error: %s\n", e.what());
        return -1;
    }

    cv::destroyAllWindows();
    return (0);
}
