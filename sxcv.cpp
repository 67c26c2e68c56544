/**
 * SXCV
 *
 * User-friendly OpenCV wrappers for introductory computer vision
 */

#include "sxcv.hpp"

namespace sxcv
{

std::string version()
{
    return "2023-01-11 10:53:50";
}

} // namespace sxcv
