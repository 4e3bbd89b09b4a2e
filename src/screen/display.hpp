#pragma once
#include <memory>
#include <string>

// Opaque Xlib handle, keeps <X11/Xlib.h> and its macros out of the headers
struct _XDisplay;

namespace x11
{
    // RAII wrapper for the X11 Display connection
    struct DisplayDeleter
    {
        void operator()(_XDisplay *disp) const;
    };
    using DisplayPtr = std::unique_ptr<_XDisplay, DisplayDeleter>;

    // Connect to the named display ("" = $DISPLAY), throws ClickerError on failure
    DisplayPtr openDisplay(const std::string &display_name);

    // Printable display name for log lines
    std::string describeDisplay(const std::string &display_name);

} // namespace x11
