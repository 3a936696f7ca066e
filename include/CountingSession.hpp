#pragma once
#include "Config.hpp"
#include "CrossingEvaluator.hpp"
#include "DetectionSource.hpp"
#include "Errors.hpp"
#include "SessionAggregator.hpp"
#include "SessionStore.hpp"
#include "Tracker.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

struct SessionOutcome
{
    ErrorKind       error = ErrorKind::None;
    std::string     message;
    SessionSnapshot final_snapshot;
    bool            final_persisted      = false;
    int             frames_processed     = 0;
    int             persistence_failures = 0;   // periodic and final
};

/** What an observer sees after each processed frame. */
struct FrameView
{
    const FrameDetections&            frame;
    const std::vector<TrackedObject>& objects;
    const LineSegment*                line;       // null in unique mode
    const SessionAggregator&          aggregator;
};

using FrameObserver = std::function<void(const FrameView&)>;

/**
 * One counting session over one stream: pull a frame, track, count,
 * flush on the record interval, flush once more on the way out.
 * Single use; a new stream attempt needs a new session.
 */
class CountingSession
{
public:
    using Clock = std::function<WallClock::time_point()>;

    CountingSession(const AppConfig& cfg, DetectionSource& source, SnapshotSink& sink,
                    Clock clock = &WallClock::now);

    /** Runs until end of stream, a read failure, or `stop` becomes true. */
    SessionOutcome run(const std::atomic<bool>& stop, const FrameObserver& observer = {});

    /** Track / count one frame; exposed for stepping without a source. */
    void process(const FrameDetections& frame);

    const Tracker&           tracker() const { return tracker_; }
    const SessionAggregator& aggregator() const { return aggregator_; }
    const CrossingEvaluator& evaluator() const { return evaluator_; }

private:
    bool flush(const SessionSnapshot& snapshot, SessionOutcome& out);
    void finish(SessionOutcome& out);

    AppConfig         cfg_;
    DetectionSource&  source_;
    SnapshotSink&     sink_;
    Clock             clock_;
    Tracker           tracker_;
    CrossingEvaluator evaluator_;
    SessionAggregator aggregator_;
};
