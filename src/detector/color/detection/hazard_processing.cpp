#include "hazard_processing.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

namespace hazard_processing
{
    vector<Point> findHazardCenters(const Mat &hazardMask)
    {
        vector<Point> centers;
        if (hazardMask.empty())
            return centers;

        // Outer boundaries only, holes inside a hazard are not hazards of their own
        vector<vector<Point>> contours;
        findContours(hazardMask.clone(), contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

        centers.reserve(contours.size());
        for (const auto &contour : contours)
        {
            centers.push_back(math::calculateBoxCenter(boundingRect(contour)));
        }

        return centers;
    }

    bool isHazardNear(const Rect &candidate, const vector<Point> &hazardCenters, const HazardParams &params)
    {
        Point center = math::calculateBoxCenter(candidate);

        for (const auto &hazardCenter : hazardCenters)
        {
            if (math::distanceToPoint(center, hazardCenter) < params.hazardRadius)
            {
                return true;
            }
        }
        return false;
    }

    bool isHazardNear(const Rect &candidate, const Mat &hazardMask, const HazardParams &params)
    {
        return isHazardNear(candidate, findHazardCenters(hazardMask), params);
    }

} // namespace hazard_processing
