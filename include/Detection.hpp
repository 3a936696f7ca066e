#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

struct BoundingBox
{
    double      x1 = 0, y1 = 0, x2 = 0, y2 = 0;   // pixels
    std::string label;
    float       confidence = 0.0f;

    cv::Point2d centre() const { return {(x1 + x2) * 0.5, (y1 + y2) * 0.5}; }
};

struct FrameDetections
{
    double                   ts = 0.0;   // seconds since epoch
    cv::Size                 size;
    std::vector<BoundingBox> boxes;
    cv::Mat                  image;      // empty for replayed detections
};
