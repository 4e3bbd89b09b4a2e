#include "mask_processing.hpp"
#include "utils.hpp"
#include <stdexcept>

using namespace cv;
using namespace std;

namespace mask_processing
{
    Mat buildMask(const Mat &hsvFrame, const ColorBand &band, const MaskParams &params)
    {
        Mat mask;
        inRange(hsvFrame, band.lower, band.upper, mask);

        // Empty kernel = 3x3 rectangle
        erode(mask, mask, Mat(), Point(-1, -1), params.erodeIterations);
        dilate(mask, mask, Mat(), Point(-1, -1), params.dilateIterations);

        return mask;
    }

    MaskBundle processMasks(const Mat &frame, const MaskParams &params)
    {
        if (frame.empty() || frame.type() != CV_8UC3)
        {
            throw invalid_argument("Mask processing needs a non-empty 3-channel 8-bit frame");
        }

        // Convert once, threshold three times
        Mat hsvFrame;
        cvtColor(frame, hsvFrame, COLOR_BGR2HSV);

        MaskBundle result;
        result.pinkMask = buildMask(hsvFrame, params.pink, params);
        result.greenMask = buildMask(hsvFrame, params.green, params);
        result.bombMask = buildMask(hsvFrame, params.bomb, params);

        log_debug("Mask pixels pink/green/bomb: " + log_string(countNonZero(result.pinkMask)) + "/" +
                  log_string(countNonZero(result.greenMask)) + "/" + log_string(countNonZero(result.bombMask)));

        return result;
    }

} // namespace mask_processing
