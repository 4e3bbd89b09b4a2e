#pragma once
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

using namespace cv;
using namespace std;

// Screen rectangle watched by the bot, in absolute screen pixels
struct Region
{
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool isValid() const { return width > 0 && height > 0; }
    string toString() const
    {
        return "(" + to_string(x) + "," + to_string(y) + ") " + to_string(width) + "x" + to_string(height);
    }
};

// How the click sink should treat the selected points
enum class SelectionKind
{
    SINGLE,  // Exactly one preferred target, click once
    SEQUENCE // Every point in order, may be empty
};

// Output of the selection policy, always stored as a list
struct Selection
{
    SelectionKind kind = SelectionKind::SEQUENCE;
    vector<Point> points;

    bool empty() const { return points.empty(); }
    bool operator==(const Selection &other) const { return kind == other.kind && points == other.points; }
};

// Result structure with all detection data for one cycle
struct DetectorResult
{
    Selection selection;

    // Metadata for debugging/analysis
    int pink_count = 0;     // Pink detections that survived the filters
    int green_count = 0;    // Green detections that survived the filters (0 when green was not evaluated)
    int hazard_count = 0;   // Hazard blobs seen in this frame
    int processing_time_ms = 0;

    // Something to click
    operator bool() const { return !selection.empty(); }
};

// Abstract interface for any click-target detection method
class DetectorInterface
{
public:
    virtual ~DetectorInterface() = default;

    // Process one captured frame of the given region
    virtual DetectorResult process(const Mat &frame, const Region &region) = 0;
};
