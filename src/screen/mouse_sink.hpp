#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include "detector/detector_interface.hpp"
#include "display.hpp"
#include "screen_interface.hpp"

using namespace cv;
using namespace std;

// Left clicks at absolute screen coordinates, injected through the XTest extension
class MouseSink : public ClickSinkInterface
{
public:
    // Throws ClickerError when the display cannot be opened or lacks XTest
    explicit MouseSink(const string &display_name = "");

    // Move the pointer to the point and press/release button 1 there
    void click(const Point &point);

    // Single selection: one click. Sequence: one click per point, in order.
    // Returns the number of clicks sent.
    int clickSelection(const Selection &selection) override;

private:
    x11::DisplayPtr display;
};
