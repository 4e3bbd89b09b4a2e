#pragma once
#include <opencv2/opencv.hpp>
#include <string>
#include "detector/detector_interface.hpp"
#include "display.hpp"
#include "screen_interface.hpp"

using namespace cv;
using namespace std;

// Grabs one screen rectangle per call from the X server root window.
// The connection is opened on first use and kept, the pixels are never cached.
class ScreenCapture : public CaptureInterface
{
public:
    explicit ScreenCapture(const string &display_name = "");

    // Fresh BGR frame of exactly region.height x region.width.
    // Throws InvalidRegionError before touching the display, CaptureError on any grab failure.
    Mat capture(const Region &region) override;

    // Root window size, throws CaptureError without a display
    Size screenSize();

    // Throws InvalidRegionError for a region without area
    static void validateRegion(const Region &region);

    // Only 32 bpp little-endian xRGB can be read as BGRA, throws CaptureError otherwise.
    // byte_order takes the Xlib LSBFirst/MSBFirst values.
    static void validatePixelLayout(int bits_per_pixel, int byte_order,
                                    unsigned long red_mask, unsigned long green_mask, unsigned long blue_mask);

private:
    void connect();

    string display_name;
    x11::DisplayPtr display;
};
