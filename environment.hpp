/**
 * SXCV
 *
 * Settings extracted from the SXCV environment variable
 *
 * The variable holds whitespace-separated keywords, case-insensitive:
 *   debug     enable debugging output and image displays
 *   sixel16   show debug images in the terminal via img2sixel, 16 levels
 *   sixel256  show debug images in the terminal via img2sixel, 256 levels
 * e.g. export SXCV="debug sixel256"
 */

#pragma once
#include <set>
#include <string>

namespace sxcv
{

// We occasionally have to do things differently on different operating systems
enum class OsFamily
{
    Linux,
    MacOS,
    Windows,
    Other
};

// Operating system this binary was built for
OsFamily host_os();

// Immutable set of lowercase keywords
class Environment
{
public:
    Environment() = default;
    explicit Environment(const std::string &value);

    // Reads the variable `key`; an unset variable gives no keywords
    static Environment from_env(const char *key = "SXCV");

    bool has(const std::string &keyword) const;
    bool empty() const { return words.empty(); }
    // true when the "debug" keyword was given
    bool debug() const { return has("debug"); }
    const std::set<std::string> &keywords() const { return words; }

private:
    std::set<std::string> words;
};

} // namespace sxcv
