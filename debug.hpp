/**
 * SXCV
 *
 * Debug mode: a single on/off switch
 *
 * Debug mode can be turned on or off explicitly by a program (the neatest way
 * is a "-debug" command-line qualifier that calls debug_on()), or for any
 * program by putting the word "debug" in the SXCV environment variable.
 */

#pragma once

namespace sxcv
{

class DebugState
{
public:
    explicit DebugState(bool initial = false) : value(initial) {}

    void set(bool v) { value = v; }
    bool get() const { return value; }
    void on() { set(true); }
    void off() { set(false); }

private:
    bool value;
};

// Process-wide debug state, initialised from the SXCV environment variable.
// Not synchronised: intended for single-threaded scripts and lab programs.
void debug_set(bool value);
bool debugging();
void debug_on();
void debug_off();

} // namespace sxcv
