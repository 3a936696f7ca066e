#pragma once
#include "Tracker.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <string>

enum class Orientation { Horizontal, Vertical, Diagonal };

// horizontal line -> Vertical axis check, vertical line -> Horizontal axis check
enum class DirectionMode { Vertical, Horizontal, Diag1, Diag2 };

enum class CountingAlgorithm { Standard, Threshold };

enum class Bucket { First, Second };   // up/left/diag1, down/right/diag2

struct CountingLine
{
    Orientation   orientation = Orientation::Horizontal;
    double        position    = 0.5;     // fraction of height/width/shorter side
    DirectionMode mode        = DirectionMode::Vertical;
};

struct LineSegment
{
    cv::Point2d p1, p2;
};

struct CrossingEvent
{
    int         track_id     = -1;
    Bucket      bucket       = Bucket::First;
    std::string label;
    double      displacement = 0.0;
    double      timestamp    = 0.0;
};

/** Direction mode implied by an orientation; diagonal keeps `requested` if it is diag1/diag2. */
DirectionMode resolve_direction(Orientation o, DirectionMode requested);

/** End points of `line` on a frame of `frame` pixels. */
LineSegment line_segment(const CountingLine& line, const cv::Size& frame);

/** Bucket name for the given orientation: up/down, left/right, diag1/diag2. */
const char* bucket_label(Orientation o, Bucket b);

class CrossingEvaluator
{
public:
    CrossingEvaluator(const CountingLine& line,
                      CountingAlgorithm   algorithm        = CountingAlgorithm::Standard,
                      int                 min_displacement = 10);

    /** Re-resolve the segment when the frame size changes. */
    void set_frame_size(const cv::Size& frame);
    void set_segment(const LineSegment& segment) { segment_ = segment; }

    /**
     * Check one identity's previous -> current step against the line.
     * Returns an event only when a crossing happened and passed the
     * displacement gate. Counted identities never produce events.
     */
    std::optional<CrossingEvent> evaluate(const TrackedObject& obj, double ts = 0.0);

    /** Side of the crossing without any gating, empty when the line was not crossed. */
    std::optional<Bucket> detect(const cv::Point2d& prev, const cv::Point2d& curr) const;

    double displacement(const cv::Point2d& prev, const cv::Point2d& curr) const;

    /** Signed perpendicular distance from `p` to the segment's supporting line. */
    static double signed_distance(const LineSegment& s, const cv::Point2d& p);

    const LineSegment&  segment() const { return segment_; }
    const CountingLine& line() const { return line_; }
    int rejected() const { return rejected_; }

private:
    CountingLine      line_;
    CountingAlgorithm algorithm_;
    int               min_displacement_;
    LineSegment       segment_;
    cv::Size          frame_;
    int               rejected_ = 0;   // crossings dropped by the gate
};
