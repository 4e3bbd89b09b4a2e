#pragma once

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <vector>

// Synthetic frames and masks for the detection tests
namespace test_frames
{
    // BGR colors that land inside exactly one band
    inline const cv::Scalar PINK_BGR(128, 0, 255);   // HSV ~(165, 255, 255)
    inline const cv::Scalar GREEN_BGR(0, 255, 0);    // HSV (60, 255, 255)
    inline const cv::Scalar BOMB_BGR(128, 128, 128); // HSV (0, 0, 128)

    // Black is outside every band (V = 0)
    inline cv::Mat blankFrame(int width, int height)
    {
        return cv::Mat::zeros(height, width, CV_8UC3);
    }

    inline cv::Mat blankMask(int width, int height)
    {
        return cv::Mat::zeros(height, width, CV_8UC1);
    }

    // Filled square whose bounding-box center is exactly `center` (side must be even)
    inline cv::Rect paintBlob(cv::Mat &image, cv::Point center, int side, const cv::Scalar &color)
    {
        cv::Rect box(center.x - side / 2, center.y - side / 2, side, side);
        cv::rectangle(image, box, color, cv::FILLED);
        return box;
    }

    // Order-independent comparison, contour order is implementation defined
    inline std::vector<cv::Point> sorted(std::vector<cv::Point> points)
    {
        std::sort(points.begin(), points.end(), [](const cv::Point &a, const cv::Point &b)
                  { return a.x != b.x ? a.x < b.x : a.y < b.y; });
        return points;
    }
}
