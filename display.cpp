/**
 * SXCV
 *
 * Showing images: in a pop-up window, or as sixel graphics directly in the
 * terminal when debugging
 */

#include <cstdio>
#include <cstdlib>
#include "display.hpp"

namespace sxcv
{

DisplayMode resolve_display_mode(bool debug, const Environment &env, OsFamily os)
{
    if (!debug)
        return {DisplayPolicy::Skip, 0};

    bool sixels_possible = (os != OsFamily::Windows);
    if (sixels_possible && env.has("sixel16"))
        return {DisplayPolicy::TerminalGraphics, 16};
    if (sixels_possible && env.has("sixel256"))
        return {DisplayPolicy::TerminalGraphics, 256};
    return {DisplayPolicy::Popup, 0};
}

void HighGuiBackend::show_window(const cv::Mat &im, const std::string &title, int delay, bool destroy)
{
    cv::imshow(title, im);
    cv::waitKey(delay);
    if (destroy)
        cv::destroyWindow(title);
}

bool HighGuiBackend::run_command(const std::string &cmd)
{
    int status = std::system(cmd.c_str());
    return status == 0;
}

TempImageFile::TempImageFile(const std::string &suffix)
    : filename(cv::tempfile(suffix.c_str()))
{
}

TempImageFile::~TempImageFile()
{
    // the file may never have been written, so a failed remove is expected
    std::remove(filename.c_str());
}

bool TempImageFile::write(const cv::Mat &im) const
{
    return cv::imwrite(filename, im);
}

Dispatcher::Dispatcher(const Environment &env, DisplayBackend &backend, OsFamily os, std::ostream &out)
    : env(env), backend(backend), os(os), out(out), state(env.debug()), program("sxcv")
{
}

DisplayMode Dispatcher::mode() const
{
    return resolve_display_mode(state.get(), env, os);
}

void Dispatcher::display(const cv::Mat &im, const std::string &title, int delay, bool destroy)
{
    const std::string &name = title.empty() ? program : title;
    backend.show_window(im, name, delay, destroy);
}

bool Dispatcher::display_sixel(const cv::Mat &im, const std::string &title, int levels)
{
    // the sixels go into the terminal, so put the title above them to find
    // them when scrolling back
    out << title << ":" << std::endl;

    bool shown = false;
    {
        // img2sixel needs an uncompressed format, hence PNG
        TempImageFile tmp(".png");
        if (tmp.write(im))
        {
            char cmd[1024];
            snprintf(cmd, sizeof(cmd), "img2sixel -p %d '%s' 2>/dev/null", levels, tmp.path().c_str());
            shown = backend.run_command(cmd);
        }
        else
        {
            out << "Error: Could not write temporary image " << tmp.path() << std::endl;
        }
    }

    // terminate the line in case img2sixel didn't
    out << std::endl;
    return shown;
}

DisplayMode Dispatcher::debug_display(const cv::Mat &im, const std::string &title, int delay, bool destroy)
{
    DisplayMode m = mode();
    switch (m.policy)
    {
    case DisplayPolicy::Skip:
        break;
    case DisplayPolicy::TerminalGraphics:
        // best effort: if img2sixel is missing or fails, nothing is shown
        // and the caller carries on regardless
        display_sixel(im, title, m.levels);
        break;
    case DisplayPolicy::Popup:
        display(im, title, delay, destroy);
        break;
    }
    return m;
}

Dispatcher &dispatcher()
{
    static HighGuiBackend backend;
    static Dispatcher instance(Environment::from_env(), backend);
    return instance;
}

void display(const cv::Mat &im, const std::string &title, int delay, bool destroy)
{
    dispatcher().display(im, title, delay, destroy);
}

void ddisplay(const cv::Mat &im, const std::string &title, int delay, bool destroy)
{
    dispatcher().debug_display(im, title, delay, destroy);
}

} // namespace sxcv
