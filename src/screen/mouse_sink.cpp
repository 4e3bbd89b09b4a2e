#include "mouse_sink.hpp"
#include "utils.hpp"

#include <X11/Xlib.h>
#include <X11/extensions/XTest.h>

using namespace cv;
using namespace std;

MouseSink::MouseSink(const string &display_name)
    : display(x11::openDisplay(display_name))
{
    int event_base, error_base, major, minor;
    if (!XTestQueryExtension(display.get(), &event_base, &error_base, &major, &minor))
    {
        throw ClickerError("XTest extension is not available on display " + x11::describeDisplay(display_name));
    }
    log_debug("XTest " + to_string(major) + "." + to_string(minor) + " available for clicks");
}

void MouseSink::click(const Point &point)
{
    // Screen -1 = the screen the pointer is on
    if (!XTestFakeMotionEvent(display.get(), -1, point.x, point.y, CurrentTime))
    {
        throw ClickerError("XTest failed to move the pointer to (" + to_string(point.x) + "," + to_string(point.y) + ")");
    }
    if (!XTestFakeButtonEvent(display.get(), Button1, True, CurrentTime))
    {
        throw ClickerError("XTest failed to press button 1");
    }
    if (!XTestFakeButtonEvent(display.get(), Button1, False, CurrentTime))
    {
        throw ClickerError("XTest failed to release button 1");
    }
    // Round trip so the click has landed before the next one is queued
    XSync(display.get(), False);
}

int MouseSink::clickSelection(const Selection &selection)
{
    if (selection.empty())
        return 0;

    if (selection.kind == SelectionKind::SINGLE)
    {
        click(selection.points.front());
        return 1;
    }

    for (const auto &point : selection.points)
    {
        click(point);
    }
    return static_cast<int>(selection.points.size());
}
