#pragma once
#include "Detection.hpp"
#include <opencv2/dnn.hpp>
#include <string>
#include <vector>

/** YOLOv8/11 ONNX model run through OpenCV DNN, output [1, 84, N]. */
class YoloDetector
{
public:
    static constexpr int kInputSize = 640;   // must match blobFromImage size

    /** Throws cv::Exception when the model cannot be read. */
    YoloDetector(const std::string& model_path,
                 float conf_threshold = 0.5f,
                 float nms_threshold  = 0.4f);

    std::vector<BoundingBox> detect(const cv::Mat& frame);

private:
    cv::dnn::Net net_;
    float conf_threshold_;
    float nms_threshold_;
    cv::Mat blob_;
};
