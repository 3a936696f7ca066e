#include "Tracker.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

using namespace std;

// -------- utility functions --------------

double Tracker::centre_dist(const TrackedObject& t, const cv::Point2d& c)
{
    return hypot(c.x - t.centroid.x, c.y - t.centroid.y);
}

// Unmatched identities get one frame older; those past the tolerance are dropped
void Tracker::age(const vector<bool>& matched)
{
    for (size_t i = 0; i < objects_.size(); ++i) {
        if (!matched[i]) objects_[i].disappeared_frames++;
    }
    objects_.erase(remove_if(objects_.begin(), objects_.end(),
        [&](const TrackedObject& t) { return t.disappeared_frames > max_disappeared_; }),
        objects_.end());
}

// -------- Tracker implementation ------------

Tracker::Tracker(int max_disappeared)
    : max_disappeared_(max_disappeared), next_id_(0) {}

int Tracker::register_centroid(const cv::Point2d& centroid)
{
    TrackedObject obj;
    obj.id       = next_id_++;
    obj.centroid = centroid;
    obj.previous = centroid;
    objects_.push_back(obj);
    return obj.id;
}

void Tracker::deregister(int id)
{
    objects_.erase(remove_if(objects_.begin(), objects_.end(),
        [id](const TrackedObject& t) { return t.id == id; }),
        objects_.end());
}

bool Tracker::mark_counted(int id)
{
    auto it = find_if(objects_.begin(), objects_.end(),
                      [id](const TrackedObject& t) { return t.id == id; });
    if (it == objects_.end() || it->counted) return false;
    it->counted = true;
    return true;
}

const TrackedObject* Tracker::find(int id) const
{
    auto it = find_if(objects_.begin(), objects_.end(),
                      [id](const TrackedObject& t) { return t.id == id; });
    return it == objects_.end() ? nullptr : &*it;
}

const vector<TrackedObject>& Tracker::update(const vector<cv::Point2d>& centroids)
{
    if (centroids.empty()) {
        age(vector<bool>(objects_.size(), false));
        return objects_;
    }

    if (objects_.empty()) {
        for (const auto& c : centroids) register_centroid(c);
        return objects_;
    }

    // Full distance matrix, rows = identities, cols = detections
    int nT = objects_.size(), nD = centroids.size();
    vector<vector<double>> dist(nT, vector<double>(nD));
    vector<double> row_min(nT, numeric_limits<double>::infinity());
    vector<int>    row_arg(nT, 0);

    for (int ti = 0; ti < nT; ++ti) {
        for (int di = 0; di < nD; ++di) {
            dist[ti][di] = centre_dist(objects_[ti], centroids[di]);
            if (dist[ti][di] < row_min[ti]) {
                row_min[ti] = dist[ti][di];
                row_arg[ti] = di;
            }
        }
    }

    // Greedy: closest identities claim their nearest detection first
    vector<int> rows(nT);
    iota(rows.begin(), rows.end(), 0);
    stable_sort(rows.begin(), rows.end(),
                [&](int a, int b) { return row_min[a] < row_min[b]; });

    vector<bool> used_row(nT, false), used_col(nD, false);
    for (int ti : rows) {
        int di = row_arg[ti];
        if (used_row[ti] || used_col[di]) continue;

        TrackedObject& obj = objects_[ti];
        obj.previous = obj.centroid;
        obj.centroid = centroids[di];
        obj.disappeared_frames = 0;
        used_row[ti] = true;
        used_col[di] = true;
    }

    age(used_row);

    for (int di = 0; di < nD; ++di) {
        if (!used_col[di]) register_centroid(centroids[di]);
    }
    return objects_;
}
