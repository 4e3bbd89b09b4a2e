#include "display.hpp"
#include "utils.hpp"

#include <X11/Xlib.h>
#include <cstdlib>

namespace x11
{
    namespace
    {
        // Default Xlib handler terminates the process on BadMatch & co, report and carry on instead
        int handleXError(Display *display, XErrorEvent *event)
        {
            char text[256] = {0};
            XGetErrorText(display, event->error_code, text, sizeof(text));
            log_warning("X11 error " + std::to_string(event->error_code) + " (" + text + ") on request " +
                        std::to_string(event->request_code));
            return 0;
        }
    }

    void DisplayDeleter::operator()(_XDisplay *disp) const
    {
        if (disp)
            XCloseDisplay(disp);
    }

    DisplayPtr openDisplay(const std::string &display_name)
    {
        DisplayPtr display(XOpenDisplay(display_name.empty() ? nullptr : display_name.c_str()));
        if (!display)
        {
            throw ClickerError("Failed to connect to X server on display " + describeDisplay(display_name));
        }

        XSetErrorHandler(handleXError);
        log_debug("Connected to X server on display " + describeDisplay(display_name));
        return display;
    }

    std::string describeDisplay(const std::string &display_name)
    {
        if (!display_name.empty())
            return display_name;

        const char *env = std::getenv("DISPLAY");
        return env ? std::string(env) : std::string("<unset>");
    }

} // namespace x11
