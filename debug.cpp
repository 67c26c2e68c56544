/**
 * SXCV
 *
 * Debug mode: a single on/off switch
 */

#include "debug.hpp"
#include "display.hpp"

namespace sxcv
{

void debug_set(bool value)
{
    dispatcher().debug().set(value);
}

bool debugging()
{
    return dispatcher().debug().get();
}

void debug_off()
{
    debug_set(false);
}

void debug_on()
{
    debug_set(true);
}

} // namespace sxcv
