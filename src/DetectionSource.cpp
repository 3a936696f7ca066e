#include "DetectionSource.hpp"
#include "ClassCatalog.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

// -----------------------------------------------------------------------------
// Parse ISO timestamp string to seconds-since-epoch (double)
double parse_iso(const std::string& s)
{
    std::tm tm{}; double frac = 0.0; char dot;
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail())
        throw std::runtime_error("bad timestamp '" + s + "'");
    if (ss.peek() == '.') {
        ss >> dot;
        std::string micros;
        ss >> micros;
        frac = std::stod("0." + micros);
    }
    std::time_t t = timegm(&tm);
    return double(t) + frac;
}

static bool same_label(const std::string& a, const std::string& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::vector<cv::Point2d> class_centroids(const std::vector<BoundingBox>& boxes,
                                         const std::string& object_type)
{
    std::vector<cv::Point2d> centroids;
    for (const auto& b : boxes) {
        // labels outside the catalog are dropped, not errors
        if (!coco::class_index(b.label)) continue;
        if (same_label(b.label, object_type)) centroids.push_back(b.centre());
    }
    return centroids;
}

// -----------------------------------------------------------------------------
// ReplayDetectionSource

ReplayDetectionSource::ReplayDetectionSource(std::string path)
    : path_(std::move(path)) {}

void ReplayDetectionSource::open()
{
    std::ifstream in(path_);
    if (!in.is_open())
        throw StreamError(ErrorKind::StreamUnavailable, "cannot open replay file " + path_);
    try {
        in >> frames_;
    } catch (const nlohmann::json::parse_error& e) {
        throw StreamError(ErrorKind::StreamUnavailable,
                          "cannot parse replay file " + path_ + ": " + e.what());
    }
    if (!frames_.is_array())
        throw StreamError(ErrorKind::StreamUnavailable, path_ + " must hold an array of frames");
    next_ = 0;
    std::cout << "[source] replaying " << frames_.size() << " frames from " << path_ << std::endl;
}

ReadStatus ReplayDetectionSource::read(FrameDetections& frame)
{
    if (next_ >= frames_.size()) return ReadStatus::EndOfStream;
    const auto& f = frames_[next_++];

    try {
        frame.ts   = parse_iso(f.at("timestamp").get<std::string>());
        frame.size = cv::Size(f.at("width").get<int>(), f.at("height").get<int>());
        frame.image.release();
        frame.boxes.clear();

        for (auto& d : f.at("detections")) {
            BoundingBox b;
            b.label = d.at("label").get<std::string>();
            b.x1 = d.at("x1").get<double>(); b.y1 = d.at("y1").get<double>();
            b.x2 = d.at("x2").get<double>(); b.y2 = d.at("y2").get<double>();
            b.confidence = d.value("confidence", 1.0f);

            if (b.x2 <= b.x1 || b.y2 <= b.y1) {
                std::ostringstream msg;
                msg << "Invalid detection at " << f.at("timestamp")
                    << " with box (" << b.x1 << "," << b.y1 << ")-(" << b.x2 << "," << b.y2 << ")";
                last_error_ = msg.str();
                return ReadStatus::DecodeFailure;
            }
            frame.boxes.push_back(std::move(b));
        }
    } catch (const std::exception& e) {
        last_error_ = "frame " + std::to_string(next_ - 1) + ": " + e.what();
        return ReadStatus::DecodeFailure;
    }
    return ReadStatus::Ok;
}

void ReplayDetectionSource::release()
{
    frames_ = nlohmann::json();
    next_ = 0;
}

// -----------------------------------------------------------------------------
// VideoDetectionSource

ReadStatus failed_read_status(bool local_file, int frames_read,
                              double position, double frame_count)
{
    if (frame_count > 0 && position >= frame_count) return ReadStatus::EndOfStream;
    // container frame counts are estimates; trust the demuxer running dry
    if (local_file && frames_read > 0) return ReadStatus::EndOfStream;
    return ReadStatus::DecodeFailure;
}

VideoDetectionSource::VideoDetectionSource(std::string url, std::string model_path,
                                           float conf_threshold, float nms_threshold)
    : url_(std::move(url)), model_path_(std::move(model_path)),
      conf_threshold_(conf_threshold), nms_threshold_(nms_threshold) {}

void VideoDetectionSource::open()
{
    try {
        detector_ = std::make_unique<YoloDetector>(model_path_, conf_threshold_, nms_threshold_);
    } catch (const cv::Exception& e) {
        throw StreamError(ErrorKind::StreamUnavailable,
                          "cannot load model " + model_path_ + ": " + e.what());
    }

    if (!cap_.open(url_, cv::CAP_FFMPEG) || !cap_.isOpened())
        throw StreamError(ErrorKind::StreamUnavailable, "cannot open stream " + url_);

    std::error_code ec;
    local_file_  = std::filesystem::is_regular_file(url_, ec);
    frames_read_ = 0;

    int width  = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
    int height = static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
    std::cout << "[source] opened " << url_ << " (" << width << "x" << height << ")" << std::endl;
}

ReadStatus VideoDetectionSource::read(FrameDetections& frame)
{
    try {
        if (!cap_.read(img_) || img_.empty()) {
            ReadStatus st = failed_read_status(local_file_, frames_read_,
                                               cap_.get(cv::CAP_PROP_POS_FRAMES),
                                               cap_.get(cv::CAP_PROP_FRAME_COUNT));
            if (st == ReadStatus::DecodeFailure)
                last_error_ = "cannot decode frame " + std::to_string(frames_read_) +
                              " from " + url_;
            return st;
        }
        ++frames_read_;

        auto now = std::chrono::system_clock::now().time_since_epoch();
        frame.ts    = std::chrono::duration<double>(now).count();
        frame.size  = img_.size();
        frame.image = img_;
        frame.boxes = detector_->detect(img_);
    } catch (const cv::Exception& e) {
        last_error_ = e.what();
        return ReadStatus::DecodeFailure;
    }
    return ReadStatus::Ok;
}

void VideoDetectionSource::release()
{
    if (cap_.isOpened()) cap_.release();
    detector_.reset();
}
