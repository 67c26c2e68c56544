/**
 * SXCV
 *
 * User-friendly OpenCV wrappers for introductory computer vision
 *
 * OpenCV's own interface mirrors its internals closely and is less convenient
 * than it could be for a student.  This library wraps a few OpenCV calls to
 * describe, print, display and plot images, and provides a few fixed test
 * images.  The functionality is deliberately limited: the laboratory
 * exercises add further routines to it, each with its tests.
 */

#pragma once
#include <string>
#include "debug.hpp"
#include "display.hpp"
#include "environment.hpp"
#include "errors.hpp"
#include "fixtures.hpp"
#include "histogram.hpp"
#include "inspect.hpp"

namespace sxcv
{

// Date on which the library was last significantly changed; update it when you edit the library
std::string version();

} // namespace sxcv
