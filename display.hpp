/**
 * SXCV
 *
 * Showing images: in a pop-up window, or as sixel graphics directly in the
 * terminal when debugging
 *
 * Sixel output needs the "img2sixel" program (libsixel) and a terminal that
 * understands sixels: iTerm2 on a Mac, xterm configured as a vt340 on X11,
 * foot on Wayland, mintty on Windows.  It is a really useful way of reviewing
 * and comparing the effects of processing.
 */

#pragma once
#include <iostream>
#include <string>
#include "opencv2/opencv.hpp"
#include "debug.hpp"
#include "environment.hpp"

namespace sxcv
{

// What a debug display call will do
enum class DisplayPolicy
{
    Skip,            // not debugging
    Popup,           // conventional HighGUI window
    TerminalGraphics // sixels via img2sixel
};

struct DisplayMode
{
    DisplayPolicy policy;
    int levels; // number of sixel output levels, only for TerminalGraphics
};

// Decides how a debug display is done.  Windows consoles can't show sixels,
// so the sixel keywords are ignored there.
DisplayMode resolve_display_mode(bool debug, const Environment &env, OsFamily os);

// The side effects of displaying, separated out so they can be replaced
class DisplayBackend
{
public:
    virtual ~DisplayBackend() = default;

    // Show `im` in the window `title` for `delay` ms (0 = until a key is pressed)
    virtual void show_window(const cv::Mat &im, const std::string &title, int delay, bool destroy) = 0;

    // Run a shell command, returns true if it exited successfully
    virtual bool run_command(const std::string &cmd) = 0;
};

// OpenCV HighGUI windows and std::system
class HighGuiBackend : public DisplayBackend
{
public:
    void show_window(const cv::Mat &im, const std::string &title, int delay, bool destroy) override;
    bool run_command(const std::string &cmd) override;
};

// A uniquely-named temporary file which is deleted when it goes out of scope
class TempImageFile
{
public:
    explicit TempImageFile(const std::string &suffix = ".png");
    ~TempImageFile();

    TempImageFile(const TempImageFile &) = delete;
    TempImageFile &operator=(const TempImageFile &) = delete;

    // Save `im` into the file, returns false if OpenCV could not write it
    bool write(const cv::Mat &im) const;
    const std::string &path() const { return filename; }

private:
    std::string filename;
};

// Holds the debug state and settings and routes images to the right display
class Dispatcher
{
public:
    Dispatcher(const Environment &env, DisplayBackend &backend,
               OsFamily os = host_os(), std::ostream &out = std::cout);

    DebugState &debug() { return state; }
    const DebugState &debug() const { return state; }
    const Environment &environment() const { return env; }

    // Window title used when display() is given none (normally argv[0])
    void set_program_name(const std::string &name) { program = name; }
    const std::string &program_name() const { return program; }

    // What debug_display would do right now
    DisplayMode mode() const;

    // Display an image in a pop-up window, optionally destroying it afterwards
    void display(const cv::Mat &im, const std::string &title = "", int delay = 0, bool destroy = true);

    // Display `im` as sixels via the external program img2sixel.  The title,
    // any error and the closing blank line all go to the dispatcher's stream.
    // Returns true if the image was written and img2sixel succeeded.
    bool display_sixel(const cv::Mat &im, const std::string &title, int levels = 256);

    // Display an image only when debugging, in the terminal if SXCV asks for sixels.
    // Returns the mode that was used.
    DisplayMode debug_display(const cv::Mat &im, const std::string &title, int delay = 0, bool destroy = true);

private:
    Environment env;
    DisplayBackend &backend;
    OsFamily os;
    std::ostream &out;
    DebugState state;
    std::string program;
};

// Process-wide dispatcher built from the SXCV environment variable
Dispatcher &dispatcher();

// Convenience wrappers around dispatcher()
void display(const cv::Mat &im, const std::string &title = "", int delay = 0, bool destroy = true);
void ddisplay(const cv::Mat &im, const std::string &title, int delay = 0, bool destroy = true);

} // namespace sxcv
