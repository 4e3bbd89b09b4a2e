#pragma once

#include <opencv2/opencv.hpp>
#include <functional>
#include <vector>
#include "detector/detector_interface.hpp"

using namespace cv;
using namespace std;

namespace selection_processing
{
    // Pink preempts green: first pink point as a single pick, else every green point in order
    Selection selectTargets(const vector<Point> &pinkDetections, const vector<Point> &greenDetections);

    // Same policy, green is only computed when pink came up empty
    Selection selectTargets(const vector<Point> &pinkDetections, const function<vector<Point>()> &greenDetections);

} // namespace selection_processing
