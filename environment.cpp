/**
 * SXCV
 *
 * Settings extracted from the SXCV environment variable
 */

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include "environment.hpp"

namespace sxcv
{

OsFamily host_os()
{
#if defined(_WIN32)
    return OsFamily::Windows;
#elif defined(__APPLE__)
    return OsFamily::MacOS;
#elif defined(__linux__)
    return OsFamily::Linux;
#else
    return OsFamily::Other;
#endif
}

Environment::Environment(const std::string &value)
{
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    // split on any run of whitespace
    std::istringstream ss(lower);
    std::string word;
    while (ss >> word)
    {
        words.insert(word);
    }
}

Environment Environment::from_env(const char *key)
{
    const char *value = std::getenv(key);
    if (value == nullptr)
        return Environment();
    return Environment(value);
}

bool Environment::has(const std::string &keyword) const
{
    return words.find(keyword) != words.end();
}

} // namespace sxcv
