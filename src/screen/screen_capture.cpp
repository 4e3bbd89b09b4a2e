#include "screen_capture.hpp"
#include "utils.hpp"

#include <X11/Xlib.h>
#include <memory>

using namespace cv;
using namespace std;

namespace
{
    struct ImageDeleter
    {
        void operator()(XImage *image) const
        {
            // XDestroyImage lives in Xutil.h, whose Region typedef clashes with ours
            if (image)
                image->f.destroy_image(image);
        }
    };
    using ImagePtr = unique_ptr<XImage, ImageDeleter>;
}

ScreenCapture::ScreenCapture(const string &display_name)
    : display_name(display_name)
{
}

void ScreenCapture::validateRegion(const Region &region)
{
    if (!region.isValid())
    {
        throw InvalidRegionError("Capture region " + region.toString() + " has no area");
    }
}

void ScreenCapture::validatePixelLayout(int bits_per_pixel, int byte_order,
                                        unsigned long red_mask, unsigned long green_mask, unsigned long blue_mask)
{
    if (bits_per_pixel != 32)
    {
        throw CaptureError("Unsupported screen pixel format: " + to_string(bits_per_pixel) + " bits per pixel");
    }
    if (byte_order != LSBFirst)
    {
        throw CaptureError("Unsupported screen byte order: pixels are stored most significant byte first");
    }
    if (red_mask != 0xff0000 || green_mask != 0x00ff00 || blue_mask != 0x0000ff)
    {
        throw CaptureError("Unsupported screen channel layout, expected xRGB masks");
    }
}

void ScreenCapture::connect()
{
    if (display)
        return;

    try
    {
        display = x11::openDisplay(display_name);
    }
    catch (const ClickerError &e)
    {
        throw CaptureError(e.what());
    }
}

Size ScreenCapture::screenSize()
{
    connect();

    XWindowAttributes attributes;
    if (!XGetWindowAttributes(display.get(), DefaultRootWindow(display.get()), &attributes))
    {
        throw CaptureError("Failed to query root window attributes");
    }
    return Size(attributes.width, attributes.height);
}

Mat ScreenCapture::capture(const Region &region)
{
    validateRegion(region);
    connect();

    Size screen = screenSize();
    if (region.x < 0 || region.y < 0 || region.x + region.width > screen.width || region.y + region.height > screen.height)
    {
        throw CaptureError("Region " + region.toString() + " lies outside the " +
                           to_string(screen.width) + "x" + to_string(screen.height) + " screen");
    }

    ImagePtr image(XGetImage(display.get(), DefaultRootWindow(display.get()),
                             region.x, region.y,
                             static_cast<unsigned int>(region.width), static_cast<unsigned int>(region.height),
                             AllPlanes, ZPixmap));
    if (!image)
    {
        throw CaptureError("XGetImage failed for region " + region.toString());
    }

    validatePixelLayout(image->bits_per_pixel, image->byte_order, image->red_mask, image->green_mask, image->blue_mask);

    // Little-endian xRGB is BGRA in memory, drop the alpha into a buffer we own
    Mat bgra(region.height, region.width, CV_8UC4, image->data, static_cast<size_t>(image->bytes_per_line));
    Mat frame;
    cvtColor(bgra, frame, COLOR_BGRA2BGR);

    return frame;
}
