#pragma once

#include <opencv2/opencv.hpp>
#include <cmath>

using namespace std;
using namespace cv;

namespace math
{
    // Calculates Euclidean distance between two points
    // Returns the distance as a double
    inline double distanceToPoint(const Point &p1, const Point &p2)
    {
        return std::sqrt(std::pow(p1.x - p2.x, 2) + std::pow(p1.y - p2.y, 2));
    }

    // Center of a bounding box, integer halves like the pixel grid
    inline Point calculateBoxCenter(const Rect &box)
    {
        return Point(box.x + box.width / 2, box.y + box.height / 2);
    }
}
