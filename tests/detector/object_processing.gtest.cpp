#include "detector/color/detection/object_processing.hpp"
#include "detector/color/detection/mask_processing.hpp"
#include "detector/color/detection/hazard_processing.hpp"
#include "detector/test_frames.hpp"

#include <gtest/gtest.h>
#include <opencv2/opencv.hpp>

using namespace test_frames;
using object_processing::Category;

namespace {

//! Region at a non-trivial screen offset so translation bugs show up.
Region makeRegion(int width, int height) {
    Region region;
    region.x = 100;
    region.y = 200;
    region.width = width;
    region.height = height;
    return region;
}

//! Mask with one square blob whose bounding-box center is `center`.
cv::Mat maskWithBlobAt(const Region &region, cv::Point center, int side = 10) {
    cv::Mat mask = blankMask(region.width, region.height);
    paintBlob(mask, center, side, cv::Scalar(255));
    return mask;
}

//! Full pipeline for one category: frame -> masks -> hazards -> detections.
std::vector<cv::Point> detectPink(const cv::Mat &frame, const Region &region) {
    mask_processing::MaskBundle masks = mask_processing::processMasks(frame);
    std::vector<cv::Point> hazards = hazard_processing::findHazardCenters(masks.bombMask);
    return object_processing::extractObjects(masks.pinkMask, Category::PINK, region, hazards);
}

} // namespace

TEST(ObjectProcessing, EmptyMaskYieldsNothing) {
    Region region = makeRegion(300, 200);
    EXPECT_TRUE(object_processing::extractObjects(blankMask(300, 200), Category::PINK, region, {}).empty());
    EXPECT_TRUE(object_processing::extractObjects(blankMask(300, 200), Category::GREEN, region, {}).empty());
}

// One pink blob, no hazards: its center translated by the origin plus (0, 3).
TEST(ObjectProcessing, SinglePinkBlobTranslated) {
    Region region = makeRegion(300, 200);
    cv::Mat frame = blankFrame(region.width, region.height);
    paintBlob(frame, {50, 60}, 20, PINK_BGR);

    std::vector<cv::Point> detections = detectPink(frame, region);

    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0], cv::Point(50 + 100, 60 + 200 + 3));
}

TEST(ObjectProcessing, EveryBlobReported) {
    Region region = makeRegion(300, 200);
    cv::Mat mask = blankMask(region.width, region.height);
    paintBlob(mask, {30, 40}, 10, cv::Scalar(255));
    paintBlob(mask, {150, 100}, 10, cv::Scalar(255));
    paintBlob(mask, {250, 160}, 10, cv::Scalar(255));

    std::vector<cv::Point> detections = object_processing::extractObjects(mask, Category::PINK, region, {});

    std::vector<cv::Point> expected = {{130, 243}, {250, 303}, {350, 363}};
    EXPECT_EQ(sorted(detections), expected);
}

// Hazard veto is absolute: 80 px away removes the pink blob, 150 px away keeps it.
TEST(ObjectProcessing, HazardVetoIsAbsolute) {
    Region region = makeRegion(400, 200);

    cv::Mat near = blankFrame(region.width, region.height);
    paintBlob(near, {30, 100}, 20, PINK_BGR);
    paintBlob(near, {110, 100}, 20, BOMB_BGR);
    EXPECT_TRUE(detectPink(near, region).empty());

    cv::Mat far = blankFrame(region.width, region.height);
    paintBlob(far, {30, 100}, 20, PINK_BGR);
    paintBlob(far, {180, 100}, 20, BOMB_BGR);
    std::vector<cv::Point> detections = detectPink(far, region);
    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0], cv::Point(130, 303));
}

// Only the candidates near a hazard are dropped, the rest of the mask still counts.
TEST(ObjectProcessing, HazardOnlyVetoesNeighbours) {
    Region region = makeRegion(400, 200);
    cv::Mat frame = blankFrame(region.width, region.height);
    paintBlob(frame, {30, 100}, 20, PINK_BGR);
    paintBlob(frame, {60, 100}, 10, BOMB_BGR);
    paintBlob(frame, {350, 100}, 20, PINK_BGR);

    std::vector<cv::Point> detections = detectPink(frame, region);

    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0], cv::Point(450, 303));
}

// Green admission band on a 200 px region: band = 20, admitted centers are 20..180 inclusive.
TEST(ObjectProcessing, GreenAdmissionBand) {
    Region region = makeRegion(100, 200);

    auto admitted = [&](int centerY) {
        cv::Mat mask = maskWithBlobAt(region, {50, centerY});
        return !object_processing::extractObjects(mask, Category::GREEN, region, {}).empty();
    };

    EXPECT_FALSE(admitted(10));  // 5%
    EXPECT_FALSE(admitted(19));
    EXPECT_TRUE(admitted(20));   // exactly 10%, boundary admitted
    EXPECT_TRUE(admitted(100));  // 50%
    EXPECT_TRUE(admitted(180));  // exactly 90%, boundary admitted
    EXPECT_FALSE(admitted(181));
    EXPECT_FALSE(admitted(190)); // 95%
}

// The band uses mask-local coordinates, the region's screen offset does not shift it.
TEST(ObjectProcessing, GreenBandIgnoresScreenOffset) {
    Region region = makeRegion(100, 200);
    region.y = 5000;

    cv::Mat mask = maskWithBlobAt(region, {50, 100});
    std::vector<cv::Point> detections = object_processing::extractObjects(mask, Category::GREEN, region, {});

    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0], cv::Point(150, 5103));
}

TEST(ObjectProcessing, PinkHasNoBandRule) {
    Region region = makeRegion(100, 200);
    cv::Mat mask = maskWithBlobAt(region, {50, 10});

    std::vector<cv::Point> detections = object_processing::extractObjects(mask, Category::PINK, region, {});

    ASSERT_EQ(detections.size(), 1u);
    EXPECT_EQ(detections[0], cv::Point(150, 213));
}

TEST(ObjectProcessing, AdmissionBandLimits) {
    EXPECT_FALSE(object_processing::isInsideAdmissionBand(9, 100));
    EXPECT_TRUE(object_processing::isInsideAdmissionBand(10, 100));
    EXPECT_TRUE(object_processing::isInsideAdmissionBand(90, 100));
    EXPECT_FALSE(object_processing::isInsideAdmissionBand(91, 100));

    // int(55 * 0.1) = 5
    EXPECT_FALSE(object_processing::isInsideAdmissionBand(4, 55));
    EXPECT_TRUE(object_processing::isInsideAdmissionBand(5, 55));
    EXPECT_TRUE(object_processing::isInsideAdmissionBand(50, 55));
    EXPECT_FALSE(object_processing::isInsideAdmissionBand(51, 55));
}

TEST(ObjectProcessing, ScreenPointUsesIntegerCenter) {
    Region region = makeRegion(100, 100);

    // Odd sizes round the center down
    EXPECT_EQ(object_processing::toScreenPoint(cv::Rect(10, 20, 5, 7), region), cv::Point(112, 226));

    object_processing::ObjectParams params;
    params.verticalBias = 0;
    EXPECT_EQ(object_processing::toScreenPoint(cv::Rect(10, 20, 4, 4), region, params), cv::Point(112, 222));
}

TEST(ObjectProcessing, CategoryNames) {
    EXPECT_EQ(object_processing::categoryToString(Category::PINK), "pink");
    EXPECT_EQ(object_processing::categoryToString(Category::GREEN), "green");
}
