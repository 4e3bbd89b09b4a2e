#pragma once

#include <opencv2/opencv.hpp>
#include <vector>

using namespace cv;
using namespace std;

namespace hazard_processing
{
    // Parameters for the hazard veto
    struct HazardParams
    {
        double hazardRadius = 100.0; // Candidates closer than this to a hazard center are dropped (strictly less)
    };

    // Centers of every outer hazard blob in the mask, in mask-local pixels
    vector<Point> findHazardCenters(const Mat &hazardMask);

    // True if any hazard center lies strictly within the radius of the box center
    bool isHazardNear(const Rect &candidate, const vector<Point> &hazardCenters, const HazardParams &params = HazardParams());

    // Same check straight from the mask, re-extracting hazard blobs on every call
    bool isHazardNear(const Rect &candidate, const Mat &hazardMask, const HazardParams &params = HazardParams());

} // namespace hazard_processing
