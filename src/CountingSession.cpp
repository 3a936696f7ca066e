#include "CountingSession.hpp"
#include <iostream>
#include <stdexcept>

namespace {

// Releases the source on every exit path, including decode failures
struct SourceGuard
{
    explicit SourceGuard(DetectionSource& s) : source(s) {}
    ~SourceGuard() { source.release(); }
    SourceGuard(const SourceGuard&) = delete;
    SourceGuard& operator=(const SourceGuard&) = delete;

    DetectionSource& source;
};

std::string clock_time(WallClock::time_point tp)
{
    // HH:MM:SS part of the stored format
    return format_session_time(tp).substr(11);
}

} // namespace

CountingSession::CountingSession(const AppConfig& cfg, DetectionSource& source,
                                 SnapshotSink& sink, Clock clock)
    : cfg_(cfg), source_(source), sink_(sink), clock_(std::move(clock)),
      tracker_(Tracker::kMaxDisappeared),
      evaluator_(cfg.line, cfg.counting_algorithm, cfg.min_displacement),
      aggregator_(cfg.stream_url, cfg.object_type, cfg.analysis_mode,
                  std::chrono::seconds(cfg.record_interval), clock_()) {}

void CountingSession::process(const FrameDetections& frame)
{
    evaluator_.set_frame_size(frame.size);

    const auto centroids = class_centroids(frame.boxes, cfg_.object_type);
    const auto& objects  = tracker_.update(centroids);

    for (const auto& obj : objects) {
        if (obj.counted) continue;

        if (cfg_.analysis_mode == CountingMode::Unique) {
            if (aggregator_.register_unique(obj.id)) tracker_.mark_counted(obj.id);
            continue;
        }

        int rejected = evaluator_.rejected();
        auto ev = evaluator_.evaluate(obj, frame.ts);
        if (!ev) {
            if (cfg_.verbose && evaluator_.rejected() != rejected)
                std::cout << "[session] object ID " << obj.id << " displacement "
                          << evaluator_.displacement(obj.previous, obj.centroid)
                          << " below threshold " << cfg_.min_displacement
                          << "; not counted" << std::endl;
            continue;
        }

        if (!aggregator_.record(*ev)) continue;
        tracker_.mark_counted(obj.id);
        if (cfg_.verbose)
            std::cout << "[session] object ID " << obj.id << " counted as "
                      << ev->label << std::endl;
    }
}

bool CountingSession::flush(const SessionSnapshot& s, SessionOutcome& out)
{
    try {
        sink_.upsert(s);
    } catch (const PersistenceError& e) {
        ++out.persistence_failures;
        std::cerr << "[session] cannot record interval for " << s.stream_id
                  << ": " << e.what() << std::endl;
        return false;
    }
    std::cout << "[session] recorded interval " << clock_time(s.session_start) << " - "
              << clock_time(s.session_end) << ", total: " << s.total << std::endl;
    return true;
}

void CountingSession::finish(SessionOutcome& out)
{
    out.final_snapshot  = aggregator_.terminate(clock_());
    out.final_persisted = flush(out.final_snapshot, out);
    if (!out.final_persisted && out.error == ErrorKind::None) {
        out.error   = ErrorKind::PersistenceFailure;
        out.message = "final snapshot was not stored";
    }
}

SessionOutcome CountingSession::run(const std::atomic<bool>& stop, const FrameObserver& observer)
{
    if (aggregator_.state() == SessionState::Terminated)
        throw std::logic_error("counting session already ran");

    SessionOutcome out;
    SourceGuard guard(source_);

    std::cout << "[session] started " << format_session_time(aggregator_.session_start())
              << " on " << cfg_.stream_url << " (" << to_string(cfg_.analysis_mode)
              << ", " << cfg_.object_type << ")" << std::endl;

    try {
        source_.open();
    } catch (const StreamError& e) {
        std::cerr << "[session] " << e.what() << std::endl;
        out.error   = e.kind;
        out.message = e.what();
        finish(out);
        return out;
    }

    FrameDetections frame;
    while (!stop.load()) {
        ReadStatus st = source_.read(frame);
        if (st == ReadStatus::EndOfStream) {
            std::cout << "[session] end of stream" << std::endl;
            break;
        }
        if (st == ReadStatus::DecodeFailure) {
            // keep what was counted so far; it goes out with the final flush
            out.error   = ErrorKind::DecodeFailure;
            out.message = source_.last_error();
            std::cerr << "[session] stream error: " << out.message << std::endl;
            break;
        }

        try {
            process(frame);
            ++out.frames_processed;

            if (observer) {
                const LineSegment* line = cfg_.analysis_mode == CountingMode::Directional
                                              ? &evaluator_.segment() : nullptr;
                observer(FrameView{frame, tracker_.objects(), line, aggregator_});
            }

            if (auto snap = aggregator_.tick(clock_())) flush(*snap, out);
        } catch (const std::exception& e) {
            // same path as a bad frame: stop reading, keep the counts
            out.error   = ErrorKind::DecodeFailure;
            out.message = e.what();
            std::cerr << "[session] frame " << out.frames_processed
                      << " failed: " << out.message << std::endl;
            break;
        }
    }

    finish(out);
    std::cout << "[session] ended " << format_session_time(out.final_snapshot.session_end)
              << " with total " << out.final_snapshot.total << std::endl;
    return out;
}
