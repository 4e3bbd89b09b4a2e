#include "object_processing.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

namespace object_processing
{
    string categoryToString(Category category)
    {
        switch (category)
        {
        case Category::PINK:
            return "pink";
        case Category::GREEN:
            return "green";
        default:
            return "unknown";
        }
    }

    vector<Rect> extractBlobs(const Mat &mask)
    {
        vector<Rect> blobs;
        if (mask.empty())
            return blobs;

        // Nested contours are ignored, only outermost boundaries count as objects
        vector<vector<Point>> contours;
        findContours(mask.clone(), contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

        blobs.reserve(contours.size());
        for (const auto &contour : contours)
        {
            blobs.push_back(boundingRect(contour));
        }

        return blobs;
    }

    bool isInsideAdmissionBand(int localCenterY, int regionHeight, const ObjectParams &params)
    {
        int band = static_cast<int>(regionHeight * params.admissionBandRatio);
        int topLimit = band;
        int bottomLimit = regionHeight - band;

        return localCenterY >= topLimit && localCenterY <= bottomLimit;
    }

    Point toScreenPoint(const Rect &blob, const Region &region, const ObjectParams &params)
    {
        Point center = math::calculateBoxCenter(blob);
        return Point(center.x + region.x, center.y + region.y + params.verticalBias);
    }

    vector<Point> extractObjects(
        const Mat &mask,
        Category category,
        const Region &region,
        const vector<Point> &hazardCenters,
        const ObjectParams &params,
        const hazard_processing::HazardParams &hazardParams)
    {
        vector<Point> detections;
        int vetoed = 0;
        int outOfBand = 0;

        for (const auto &blob : extractBlobs(mask))
        {
            if (hazard_processing::isHazardNear(blob, hazardCenters, hazardParams))
            {
                vetoed++;
                continue;
            }

            // Band test uses the mask-local center, before translation
            if (category == Category::GREEN && !isInsideAdmissionBand(math::calculateBoxCenter(blob).y, region.height, params))
            {
                outOfBand++;
                continue;
            }

            detections.push_back(toScreenPoint(blob, region, params));
        }

        if (vetoed > 0 || outOfBand > 0)
        {
            log_debug(categoryToString(category) + ": kept " + log_string(detections.size()) +
                      ", hazard vetoed " + log_string(vetoed) + ", out of band " + log_string(outOfBand));
        }

        return detections;
    }

} // namespace object_processing
