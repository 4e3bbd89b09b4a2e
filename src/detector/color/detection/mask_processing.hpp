#pragma once

#include <opencv2/opencv.hpp>
#include <string>

using namespace cv;
using namespace std;

namespace mask_processing
{
    // Named inclusive HSV interval (OpenCV scale: H 0-180, S/V 0-255), hue does not wrap
    struct ColorBand
    {
        string name;
        Scalar lower;
        Scalar upper;
    };

    // Parameters for mask processing
    struct MaskParams
    {
        ColorBand pink{"pink", Scalar(160, 20, 100), Scalar(180, 255, 255)}; // Target A
        ColorBand green{"green", Scalar(40, 50, 50), Scalar(80, 255, 255)};  // Target B
        ColorBand bomb{"bomb", Scalar(0, 0, 50), Scalar(180, 50, 200)};      // Hazard

        // Denoise pass with the default 3x3 structuring element, erode first
        int erodeIterations = 1;  // Kills isolated noise pixels
        int dilateIterations = 1; // Restores blob size afterwards
    };

    // One binary mask (0/255) per band, all the size of the input frame
    struct MaskBundle
    {
        Mat pinkMask;
        Mat greenMask;
        Mat bombMask;
    };

    // Threshold one HSV image against a band and denoise it
    Mat buildMask(const Mat &hsvFrame, const ColorBand &band, const MaskParams &params = MaskParams());

    // BGR frame in, three denoised masks out
    MaskBundle processMasks(const Mat &frame, const MaskParams &params = MaskParams());

} // namespace mask_processing
