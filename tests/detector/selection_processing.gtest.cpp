#include "detector/color/detection/selection_processing.hpp"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

// Pink wins: only its first element is kept, green is ignored.
TEST(SelectionProcessing, PinkPreemptsGreen) {
    std::vector<cv::Point> pink = {{10, 20}, {30, 40}};
    std::vector<cv::Point> green = {{50, 60}};

    Selection selection = selection_processing::selectTargets(pink, green);

    EXPECT_EQ(selection.kind, SelectionKind::SINGLE);
    ASSERT_EQ(selection.points.size(), 1u);
    EXPECT_EQ(selection.points[0], cv::Point(10, 20));
}

// No pink: the whole green sequence in order.
TEST(SelectionProcessing, GreenSequenceWhenNoPink) {
    std::vector<cv::Point> pink;
    std::vector<cv::Point> green = {{50, 60}, {70, 80}};

    Selection selection = selection_processing::selectTargets(pink, green);

    EXPECT_EQ(selection.kind, SelectionKind::SEQUENCE);
    EXPECT_EQ(selection.points, green);
}

TEST(SelectionProcessing, NothingToClick) {
    std::vector<cv::Point> none;

    Selection selection = selection_processing::selectTargets(none, none);

    EXPECT_EQ(selection.kind, SelectionKind::SEQUENCE);
    EXPECT_TRUE(selection.empty());
}

// Green is never computed when pink already decided the outcome.
TEST(SelectionProcessing, GreenEvaluatedOnlyWithoutPink) {
    int greenCalls = 0;
    auto green = [&greenCalls]() {
        greenCalls++;
        return std::vector<cv::Point>{{1, 2}};
    };

    std::vector<cv::Point> pink = {{3, 4}};
    Selection picked = selection_processing::selectTargets(pink, green);
    EXPECT_EQ(greenCalls, 0);
    EXPECT_EQ(picked.points, std::vector<cv::Point>{cv::Point(3, 4)});

    std::vector<cv::Point> noPink;
    Selection fallback = selection_processing::selectTargets(noPink, green);
    EXPECT_EQ(greenCalls, 1);
    EXPECT_EQ(fallback.kind, SelectionKind::SEQUENCE);
    EXPECT_EQ(fallback.points, std::vector<cv::Point>{cv::Point(1, 2)});
}
