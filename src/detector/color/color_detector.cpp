#include <chrono>
#include <filesystem>

#include "color_detector.hpp"
#include "detection/selection_processing.hpp"
#include "utils.hpp"

using namespace cv;
using namespace std;

ColorDetector::ColorDetector(bool debug_mode, const ColorDetectorParams &params)
    : debug_mode(debug_mode), params(params)
{
}

DetectorResult ColorDetector::process(const Mat &frame, const Region &region)
{
    auto start_time = chrono::steady_clock::now();

    if (!region.isValid())
    {
        throw InvalidRegionError("Region " + region.toString() + " has no area");
    }
    if (frame.cols != region.width || frame.rows != region.height)
    {
        throw InvalidRegionError("Frame " + to_string(frame.cols) + "x" + to_string(frame.rows) +
                                 " does not match region " + region.toString());
    }

    DetectorResult result;

    // 1. Three denoised masks from one HSV conversion
    mask_processing::MaskBundle masks = mask_processing::processMasks(frame, params.mask);

    // 2. Hazards are fixed for the frame, extract them once
    vector<Point> hazardCenters = hazard_processing::findHazardCenters(masks.bombMask);
    result.hazard_count = static_cast<int>(hazardCenters.size());

    // 3. Pink first, green only when pink found nothing
    vector<Point> pinkDetections = object_processing::extractObjects(
        masks.pinkMask, object_processing::Category::PINK, region, hazardCenters, params.object, params.hazard);
    result.pink_count = static_cast<int>(pinkDetections.size());

    result.selection = selection_processing::selectTargets(
        pinkDetections,
        [&]()
        {
            vector<Point> greenDetections = object_processing::extractObjects(
                masks.greenMask, object_processing::Category::GREEN, region, hazardCenters, params.object, params.hazard);
            result.green_count = static_cast<int>(greenDetections.size());
            return greenDetections;
        });

    if (debug_mode && result)
    {
        saveDebugFrames(frame, masks, hazardCenters, region);
    }

    auto end_time = chrono::steady_clock::now();
    result.processing_time_ms = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(end_time - start_time).count());
    return result;
}

void ColorDetector::saveDebugFrames(const Mat &frame, const mask_processing::MaskBundle &masks,
                                    const vector<Point> &hazardCenters, const Region &region) const
{
    std::error_code ec;
    filesystem::create_directories(debug_dir, ec);
    if (ec)
    {
        log_warning("Cannot create " + debug_dir + ": " + ec.message());
        return;
    }

    Mat visualization = frame.clone();

    // Accepted boxes in green, hazard-vetoed in red, outside the green band in yellow
    vector<pair<const Mat *, object_processing::Category>> categoryMasks = {
        {&masks.pinkMask, object_processing::Category::PINK},
        {&masks.greenMask, object_processing::Category::GREEN}};

    for (const auto &[mask, category] : categoryMasks)
    {
        for (const auto &blob : object_processing::extractBlobs(*mask))
        {
            Scalar color(0, 255, 0);
            if (hazard_processing::isHazardNear(blob, hazardCenters, params.hazard))
                color = Scalar(0, 0, 255);
            else if (category == object_processing::Category::GREEN &&
                     !object_processing::isInsideAdmissionBand(math::calculateBoxCenter(blob).y, region.height, params.object))
                color = Scalar(0, 255, 255);
            rectangle(visualization, blob, color, 1);
        }
    }
    for (const auto &hazardCenter : hazardCenters)
    {
        circle(visualization, hazardCenter, static_cast<int>(params.hazard.hazardRadius), Scalar(0, 0, 255), 1);
    }

    bool ok = imwrite(debug_dir + "/frame.png", visualization) &&
              imwrite(debug_dir + "/pink_mask.png", masks.pinkMask) &&
              imwrite(debug_dir + "/green_mask.png", masks.greenMask) &&
              imwrite(debug_dir + "/bomb_mask.png", masks.bombMask);
    if (!ok)
    {
        log_warning("Failed to write debug frames for region " + region.toString());
    }
}
