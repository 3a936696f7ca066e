#pragma once
#include "Detection.hpp"
#include "YoloDetector.hpp"
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <memory>
#include <string>
#include <vector>

enum class ReadStatus { Ok, EndOfStream, DecodeFailure };

/**
 * One frame of detections per read(). open() throws StreamError when the
 * source cannot be reached; release() may be called any number of times.
 */
class DetectionSource
{
public:
    virtual ~DetectionSource() = default;

    virtual void       open() = 0;
    virtual ReadStatus read(FrameDetections& frame) = 0;
    virtual void       release() = 0;

    /** Reason for the last DecodeFailure. */
    const std::string& last_error() const { return last_error_; }

protected:
    std::string last_error_;
};

/** Midpoints of the boxes labelled `object_type` (case-insensitive). */
std::vector<cv::Point2d> class_centroids(const std::vector<BoundingBox>& boxes,
                                         const std::string& object_type);

/**
 * Status for a capture read that returned no frame. A local file that already
 * delivered frames has ended, whatever its (estimated) frame count says.
 */
ReadStatus failed_read_status(bool local_file, int frames_read,
                              double position, double frame_count);

/** Parse ISO timestamp string to seconds-since-epoch. */
double parse_iso(const std::string& s);

/** Replays a JSON array of {timestamp, width, height, detections[]} frames. */
class ReplayDetectionSource : public DetectionSource
{
public:
    explicit ReplayDetectionSource(std::string path);

    void       open() override;
    ReadStatus read(FrameDetections& frame) override;
    void       release() override;

private:
    std::string    path_;
    nlohmann::json frames_;
    size_t         next_ = 0;
};

/** Frames from cv::VideoCapture, boxes from a YOLO ONNX model. */
class VideoDetectionSource : public DetectionSource
{
public:
    VideoDetectionSource(std::string url, std::string model_path,
                         float conf_threshold = 0.5f, float nms_threshold = 0.4f);

    void       open() override;
    ReadStatus read(FrameDetections& frame) override;
    void       release() override;

private:
    std::string url_;
    std::string model_path_;
    float conf_threshold_, nms_threshold_;
    std::unique_ptr<YoloDetector> detector_;
    cv::VideoCapture cap_;
    cv::Mat img_;
    bool local_file_  = false;
    int  frames_read_ = 0;
};
