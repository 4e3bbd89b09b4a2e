#pragma once

#include <opencv2/opencv.hpp>
#include <string>
#include <vector>
#include "detector/detector_interface.hpp"
#include "hazard_processing.hpp"

using namespace cv;
using namespace std;

namespace object_processing
{
    // Target categories, the category only selects the admission rule
    enum class Category
    {
        PINK, // Target A, admitted anywhere in the region
        GREEN // Target B, admitted only inside the middle vertical band
    };

    string categoryToString(Category category);

    // Parameters for object extraction
    struct ObjectParams
    {
        int verticalBias = 3;             // Added to screen y, visual center sits slightly above the click point
        double admissionBandRatio = 0.1;  // Green is dropped within this fraction of the top and bottom edges
    };

    // Bounding boxes of the outer blobs of a mask, in contour-discovery order
    vector<Rect> extractBlobs(const Mat &mask);

    // Mask-local vertical center inside [band, height - band], band = int(height * ratio)
    bool isInsideAdmissionBand(int localCenterY, int regionHeight, const ObjectParams &params = ObjectParams());

    // Blob center translated to absolute screen coordinates, bias included
    Point toScreenPoint(const Rect &blob, const Region &region, const ObjectParams &params = ObjectParams());

    // Mask in, admitted click points out (hazard veto first, then the category rule)
    vector<Point> extractObjects(
        const Mat &mask,
        Category category,
        const Region &region,
        const vector<Point> &hazardCenters,
        const ObjectParams &params = ObjectParams(),
        const hazard_processing::HazardParams &hazardParams = hazard_processing::HazardParams());

} // namespace object_processing
