#include "selection_processing.hpp"

using namespace cv;
using namespace std;

namespace selection_processing
{
    Selection selectTargets(const vector<Point> &pinkDetections, const function<vector<Point>()> &greenDetections)
    {
        Selection selection;

        if (!pinkDetections.empty())
        {
            selection.kind = SelectionKind::SINGLE;
            selection.points.push_back(pinkDetections.front());
            return selection;
        }

        selection.kind = SelectionKind::SEQUENCE;
        if (greenDetections)
            selection.points = greenDetections();
        return selection;
    }

    Selection selectTargets(const vector<Point> &pinkDetections, const vector<Point> &greenDetections)
    {
        return selectTargets(pinkDetections, [&greenDetections]()
                             { return greenDetections; });
    }

} // namespace selection_processing
