#pragma once
#include <opencv2/core.hpp>
#include <vector>

struct TrackedObject
{
    int         id                 = -1;
    cv::Point2d centroid;           // position in the latest matched frame
    cv::Point2d previous;           // position one match earlier
    int         disappeared_frames = 0;
    bool        counted            = false;
};

class Tracker
{
public:
    static constexpr int kMaxDisappeared = 40;

    explicit Tracker(int max_disappeared = kMaxDisappeared);

    /** Process one frame of centroids, return the live identities in id order. */
    const std::vector<TrackedObject>& update(const std::vector<cv::Point2d>& centroids);

    int  register_centroid(const cv::Point2d& centroid);
    void deregister(int id);

    /** Flip `counted` for `id`. False if the id is gone or was already counted. */
    bool mark_counted(int id);

    const TrackedObject* find(int id) const;
    const std::vector<TrackedObject>& objects() const { return objects_; }
    int next_id() const { return next_id_; }

private:
    // ─── helpers (implemented in Tracker.cpp) ────────────────────────
    void age(const std::vector<bool>& matched);
    static double centre_dist(const TrackedObject& t, const cv::Point2d& c);

    // ─── data ───────────────────────────────────────────────────────
    int max_disappeared_;
    int next_id_;
    std::vector<TrackedObject> objects_;   // ascending id
};
