#include "CrossingEvaluator.hpp"
#include <cmath>

using namespace std;

// -------- line geometry --------------

DirectionMode resolve_direction(Orientation o, DirectionMode requested)
{
    switch (o) {
    case Orientation::Horizontal: return DirectionMode::Vertical;
    case Orientation::Vertical:   return DirectionMode::Horizontal;
    case Orientation::Diagonal:
        return requested == DirectionMode::Diag2 ? DirectionMode::Diag2
                                                 : DirectionMode::Diag1;
    }
    return requested;
}

LineSegment line_segment(const CountingLine& line, const cv::Size& frame)
{
    const int W = frame.width, H = frame.height;
    LineSegment s;
    switch (line.orientation) {
    case Orientation::Horizontal: {
        int y = cvRound(H * line.position);
        s.p1 = {0.0, double(y)};
        s.p2 = {double(W), double(y)};
        break;
    }
    case Orientation::Vertical: {
        int x = cvRound(W * line.position);
        s.p1 = {double(x), 0.0};
        s.p2 = {double(x), double(H)};
        break;
    }
    case Orientation::Diagonal: {
        int offset = cvRound(min(W, H) * line.position);
        if (resolve_direction(line.orientation, line.mode) == DirectionMode::Diag1) {
            s.p1 = {0.0, double(offset)};
            s.p2 = {double(W), double(H - offset)};
        } else {
            s.p1 = {double(W), double(offset)};
            s.p2 = {0.0, double(H - offset)};
        }
        break;
    }
    }
    return s;
}

const char* bucket_label(Orientation o, Bucket b)
{
    bool first = b == Bucket::First;
    switch (o) {
    case Orientation::Horizontal: return first ? "up" : "down";
    case Orientation::Vertical:   return first ? "left" : "right";
    case Orientation::Diagonal:   return first ? "diag1" : "diag2";
    }
    return "unknown";
}

// -------- CrossingEvaluator implementation ------------

CrossingEvaluator::CrossingEvaluator(const CountingLine& line,
                                     CountingAlgorithm algorithm,
                                     int min_displacement)
    : line_(line), algorithm_(algorithm), min_displacement_(min_displacement)
{
    line_.mode = resolve_direction(line_.orientation, line_.mode);
}

void CrossingEvaluator::set_frame_size(const cv::Size& frame)
{
    if (frame == frame_) return;
    frame_   = frame;
    segment_ = line_segment(line_, frame);
}

double CrossingEvaluator::signed_distance(const LineSegment& s, const cv::Point2d& p)
{
    double vx = s.p2.x - s.p1.x;
    double vy = s.p2.y - s.p1.y;
    double norm = hypot(vx, vy);
    if (norm == 0) norm = 1;
    return ((p.x - s.p1.x) * vy - (p.y - s.p1.y) * vx) / norm;
}

optional<Bucket> CrossingEvaluator::detect(const cv::Point2d& prev,
                                           const cv::Point2d& curr) const
{
    switch (line_.orientation) {
    case Orientation::Horizontal: {
        double L = segment_.p1.y;
        if (prev.y > L && curr.y <= L) return Bucket::First;
        if (prev.y < L && curr.y >= L) return Bucket::Second;
        break;
    }
    case Orientation::Vertical: {
        double L = segment_.p1.x;
        if (prev.x > L && curr.x <= L) return Bucket::First;
        if (prev.x < L && curr.x >= L) return Bucket::Second;
        break;
    }
    case Orientation::Diagonal: {
        double d_prev = signed_distance(segment_, prev);
        double d_curr = signed_distance(segment_, curr);
        if (d_prev * d_curr < 0)
            return d_prev > 0 ? Bucket::First : Bucket::Second;
        break;
    }
    }
    return nullopt;
}

double CrossingEvaluator::displacement(const cv::Point2d& prev,
                                       const cv::Point2d& curr) const
{
    switch (line_.orientation) {
    case Orientation::Horizontal: return abs(curr.y - prev.y);
    case Orientation::Vertical:   return abs(curr.x - prev.x);
    case Orientation::Diagonal:   return abs((curr.x + curr.y) - (prev.x + prev.y));
    }
    return 0.0;
}

optional<CrossingEvent> CrossingEvaluator::evaluate(const TrackedObject& obj, double ts)
{
    if (obj.counted) return nullopt;

    auto bucket = detect(obj.previous, obj.centroid);
    if (!bucket) return nullopt;

    double disp = displacement(obj.previous, obj.centroid);
    if (algorithm_ == CountingAlgorithm::Threshold && disp < min_displacement_) {
        ++rejected_;
        return nullopt;
    }

    CrossingEvent ev;
    ev.track_id     = obj.id;
    ev.bucket       = *bucket;
    ev.label        = bucket_label(line_.orientation, *bucket);
    ev.displacement = disp;
    ev.timestamp    = ts;
    return ev;
}
