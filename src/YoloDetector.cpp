#include "YoloDetector.hpp"
#include "ClassCatalog.hpp"

YoloDetector::YoloDetector(const std::string& model_path,
                           float conf_threshold, float nms_threshold)
    : net_(cv::dnn::readNetFromONNX(model_path)),
      conf_threshold_(conf_threshold), nms_threshold_(nms_threshold)
{
    net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
    net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
}

std::vector<BoundingBox> YoloDetector::detect(const cv::Mat& frame)
{
    cv::dnn::blobFromImage(frame, blob_, 1 / 255.0,
                           cv::Size(kInputSize, kInputSize),
                           cv::Scalar(), true, false);
    net_.setInput(blob_);
    std::vector<cv::Mat> outs;
    net_.forward(outs, net_.getUnconnectedOutLayersNames());

    // [1, 84, N] -> [N, 84]; 84 = 4 bbox coords + 80 class scores
    const int attrs = 4 + coco::kNumClasses;
    cv::Mat output = outs[0];
    if (output.dims == 3 && output.size[1] == attrs) {
        cv::Mat m(output.size[1], output.size[2], CV_32F, output.ptr<float>());
        output = m.t();
    } else {
        output = output.reshape(1, static_cast<int>(output.total() / attrs));
    }

    std::vector<cv::Rect2d> boxes;
    std::vector<int>        classes;
    std::vector<float>      confidences;

    const double sx = double(frame.cols) / kInputSize;
    const double sy = double(frame.rows) / kInputSize;

    for (int i = 0; i < output.rows; ++i) {
        const float* data = output.ptr<float>(i);
        float cx = data[0], cy = data[1], w = data[2], h = data[3];

        cv::Point max_loc;
        double max_score = 0.0;
        cv::Mat scores(1, coco::kNumClasses, CV_32F, const_cast<float*>(data + 4));
        cv::minMaxLoc(scores, nullptr, &max_score, nullptr, &max_loc);

        if (max_score > conf_threshold_) {
            boxes.emplace_back((cx - w / 2) * sx, (cy - h / 2) * sy, w * sx, h * sy);
            classes.push_back(max_loc.x);
            confidences.push_back(static_cast<float>(max_score));
        }
    }

    std::vector<int> nms_idx;
    cv::dnn::NMSBoxes(boxes, confidences, conf_threshold_, nms_threshold_, nms_idx);

    std::vector<BoundingBox> result;
    result.reserve(nms_idx.size());
    for (int i : nms_idx) {
        BoundingBox b;
        b.x1 = boxes[i].x;
        b.y1 = boxes[i].y;
        b.x2 = boxes[i].x + boxes[i].width;
        b.y2 = boxes[i].y + boxes[i].height;
        b.label = coco::class_name(classes[i]);
        b.confidence = confidences[i];
        result.push_back(b);
    }
    return result;
}
