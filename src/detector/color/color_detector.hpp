#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include "../detector_interface.hpp"
#include "detection/mask_processing.hpp"
#include "detection/hazard_processing.hpp"
#include "detection/object_processing.hpp"

using namespace cv;
using namespace std;

// All tunables of the color pipeline in one place
struct ColorDetectorParams
{
    mask_processing::MaskParams mask;
    hazard_processing::HazardParams hazard;
    object_processing::ObjectParams object;
};

// Capture-independent detection cycle: frame + region in, selection out.
// Holds configuration only, every call starts from scratch.
class ColorDetector : public DetectorInterface
{
public:
    explicit ColorDetector(bool debug_mode = false, const ColorDetectorParams &params = ColorDetectorParams());
    virtual ~ColorDetector() = default;

    virtual DetectorResult process(const Mat &frame, const Region &region) override;

private:
    void saveDebugFrames(const Mat &frame, const mask_processing::MaskBundle &masks,
                         const vector<Point> &hazardCenters, const Region &region) const;

    bool debug_mode;
    ColorDetectorParams params;
    string debug_dir = "debug_frames/color_detector";
};
