/**
 * SXCV
 *
 * Exceptions raised when a caller hands the library something it cannot use
 */

#pragma once
#include <stdexcept>
#include <string>

namespace sxcv
{

// Raised when an image is neither monochrome (rank 2) nor multi-channel (rank 3)
class InvalidShapeError : public std::invalid_argument
{
public:
    explicit InvalidShapeError(int rank)
        : std::invalid_argument("I have a '" + std::to_string(rank) + "'-dimensional image!"),
          dims(rank)
    {
    }

    int rank() const { return dims; }

private:
    int dims;
};

// Raised when asked to generate something by a name we don't know (masks, plot colours)
class UnsupportedNameError : public std::invalid_argument
{
public:
    UnsupportedNameError(const std::string &kind, const std::string &name)
        : std::invalid_argument("I don't know how to generate a '" + name + "' " + kind + "!"),
          requested(name)
    {
    }

    const std::string &name() const { return requested; }

private:
    std::string requested;
};

} // namespace sxcv
