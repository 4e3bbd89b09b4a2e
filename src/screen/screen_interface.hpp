#pragma once
#include <opencv2/opencv.hpp>
#include "detector/detector_interface.hpp"

using namespace cv;
using namespace std;

// Keys of interest at the time of the poll
struct KeyState
{
    bool start_pressed = false;
    bool pause_pressed = false;
};

// Source of region frames
class CaptureInterface
{
public:
    virtual ~CaptureInterface() = default;

    // Fresh BGR frame of the region, throws InvalidRegionError or CaptureError
    virtual Mat capture(const Region &region) = 0;
};

// Receiver of the selected click targets
class ClickSinkInterface
{
public:
    virtual ~ClickSinkInterface() = default;

    // Returns the number of clicks sent, throws ClickerError when input cannot be delivered
    virtual int clickSelection(const Selection &selection) = 0;
};

// Start/pause key reader
class KeyboardInterface
{
public:
    virtual ~KeyboardInterface() = default;

    virtual KeyState poll() = 0;
};
