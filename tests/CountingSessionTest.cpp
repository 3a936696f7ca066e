#include "CountingSession.hpp"
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <utility>

using namespace std::chrono_literals;

namespace {

const WallClock::time_point kT0 = WallClock::from_time_t(1700000000);

FrameDetections frame_with(const std::vector<cv::Point2d>& centres,
                           const std::string& label = "car")
{
    FrameDetections f;
    f.size = cv::Size(640, 360);
    for (const auto& c : centres)
        f.boxes.push_back({c.x - 5, c.y - 5, c.x + 5, c.y + 5, label, 0.9f});
    return f;
}

class FakeSource : public DetectionSource
{
public:
    explicit FakeSource(std::vector<FrameDetections> frames) : frames_(std::move(frames)) {}

    void open() override
    {
        ++opened;
        if (unavailable) throw StreamError(ErrorKind::StreamUnavailable, "connection refused");
    }

    ReadStatus read(FrameDetections& frame) override
    {
        if (next_ == fail_at) {
            last_error_ = "corrupt packet";
            return ReadStatus::DecodeFailure;
        }
        if (next_ >= frames_.size()) return ReadStatus::EndOfStream;
        frame = frames_[next_++];
        return ReadStatus::Ok;
    }

    void release() override { ++released; }

    bool   unavailable = false;
    size_t fail_at     = size_t(-1);
    int    opened      = 0;
    int    released    = 0;

private:
    std::vector<FrameDetections> frames_;
    size_t next_ = 0;
};

// In-memory upsert keyed like the real table
class MemorySink : public SnapshotSink
{
public:
    void upsert(const SessionSnapshot& s) override
    {
        ++attempts;
        if (failures_left > 0) {
            --failures_left;
            throw PersistenceError("database is locked");
        }
        rows[{s.stream_id, s.session_start}] = s;
    }

    int attempts      = 0;
    int failures_left = 0;
    std::map<std::pair<std::string, WallClock::time_point>, SessionSnapshot> rows;
};

AppConfig directional(Orientation o = Orientation::Horizontal)
{
    AppConfig cfg;
    cfg.stream_url       = "rtsp://cam/1";
    cfg.object_type      = "car";
    cfg.analysis_mode    = CountingMode::Directional;
    cfg.line.orientation = o;
    cfg.line.position    = 0.5;   // y = 180 on 640x360
    validate(cfg);
    return cfg;
}

CountingSession::Clock fixed_clock()
{
    return [] { return kT0; };
}

} // namespace

TEST(CountingSessionTest, DirectionalCountsEachCrossingOnce)
{
    FakeSource src({
        frame_with({{100, 200}, {400, 150}}),
        frame_with({{100, 170}, {400, 190}}),   // id 0 up, id 1 down
        frame_with({{100, 190}, {400, 170}}),   // both cross back: ignored
        frame_with({{100, 150}, {400, 200}}),
    });
    MemorySink sink;
    CountingSession session(directional(), src, sink, fixed_clock());

    std::atomic<bool> stop{false};
    SessionOutcome out = session.run(stop);

    EXPECT_EQ(out.error, ErrorKind::None);
    EXPECT_EQ(out.frames_processed, 4);
    EXPECT_EQ(out.final_snapshot.dir1, 1);
    EXPECT_EQ(out.final_snapshot.dir2, 1);
    EXPECT_EQ(out.final_snapshot.total, 2);
    EXPECT_TRUE(out.final_persisted);
    EXPECT_EQ(session.aggregator().state(), SessionState::Terminated);

    for (const auto& t : session.tracker().objects()) EXPECT_TRUE(t.counted);

    ASSERT_EQ(sink.rows.size(), 1u);
    EXPECT_EQ(sink.rows.begin()->second.total, 2);
    EXPECT_EQ(src.opened, 1);
    EXPECT_EQ(src.released, 1);
}

TEST(CountingSessionTest, OtherClassesAndUnknownLabelsAreIgnored)
{
    FrameDetections a = frame_with({{100, 200}});
    FrameDetections b = frame_with({{100, 170}});
    b.boxes.push_back({395, 195, 405, 205, "person", 0.9f});
    b.boxes.push_back({200, 200, 210, 210, "flying saucer", 0.9f});

    FakeSource src({a, b});
    MemorySink sink;
    CountingSession session(directional(), src, sink, fixed_clock());
    std::atomic<bool> stop{false};
    SessionOutcome out = session.run(stop);

    EXPECT_EQ(out.final_snapshot.total, 1);
    EXPECT_EQ(session.tracker().objects().size(), 1u);
}

TEST(CountingSessionTest, ThresholdDefersCountToQualifyingFrame)
{
    AppConfig cfg = directional();
    cfg.counting_algorithm = CountingAlgorithm::Threshold;
    cfg.min_displacement   = 15;

    FakeSource src({
        frame_with({{100, 182}}),
        frame_with({{100, 177}}),   // crosses up by 5: rejected
        frame_with({{100, 190}}),   // crosses down by 13: rejected
        frame_with({{100, 160}}),   // crosses up by 30: counted
    });
    MemorySink sink;
    CountingSession session(cfg, src, sink, fixed_clock());
    std::atomic<bool> stop{false};
    SessionOutcome out = session.run(stop);

    EXPECT_EQ(session.evaluator().rejected(), 2);
    EXPECT_EQ(out.final_snapshot.dir1, 1);
    EXPECT_EQ(out.final_snapshot.total, 1);
}

TEST(CountingSessionTest, UniqueCountsEveryNewIdentity)
{
    AppConfig cfg = directional();
    cfg.analysis_mode = CountingMode::Unique;

    FakeSource src({
        frame_with({{10, 10}, {300, 300}}),
        frame_with({{12, 12}}),
        frame_with({{14, 14}, {300, 302}, {600, 50}}),
    });
    MemorySink sink;
    CountingSession session(cfg, src, sink, fixed_clock());
    std::atomic<bool> stop{false};
    SessionOutcome out = session.run(stop);

    EXPECT_EQ(out.final_snapshot.total, 3);
    EXPECT_EQ(out.final_snapshot.dir1, 0);
    EXPECT_EQ(out.final_snapshot.dir2, 0);
}

TEST(CountingSessionTest, PeriodicFlushesUpsertOneGrowingRecord)
{
    AppConfig cfg = directional();
    cfg.record_interval = 60;

    FakeSource src({
        frame_with({{100, 200}}),
        frame_with({{100, 170}}),
        frame_with({{400, 150}}),
        frame_with({{400, 200}}),
    });
    MemorySink sink;
    WallClock::time_point t = kT0;
    auto clock = [&t] { auto now = t; t += 30s; return now; };

    CountingSession session(cfg, src, sink, clock);
    std::atomic<bool> stop{false};
    SessionOutcome out = session.run(stop);

    // start T0; ticks at T30, T60 (flush), T90, T120 (flush); final at T150
    EXPECT_EQ(sink.attempts, 3);
    ASSERT_EQ(sink.rows.size(), 1u);
    const SessionSnapshot& stored = sink.rows.begin()->second;
    EXPECT_EQ(stored.session_start, kT0);
    EXPECT_EQ(stored.session_end, kT0 + 150s);
    EXPECT_EQ(stored.total, out.final_snapshot.total);
}

TEST(CountingSessionTest, PersistenceFailureIsRetriedAtNextBoundary)
{
    AppConfig cfg = directional();
    FakeSource src({
        frame_with({{100, 200}}),
        frame_with({{100, 170}}),
        frame_with({{100, 160}}),
        frame_with({{100, 150}}),
    });
    MemorySink sink;
    sink.failures_left = 1;
    WallClock::time_point t = kT0;
    auto clock = [&t] { auto now = t; t += 30s; return now; };

    CountingSession session(cfg, src, sink, clock);
    std::atomic<bool> stop{false};
    SessionOutcome out = session.run(stop);

    EXPECT_EQ(out.error, ErrorKind::None);
    EXPECT_EQ(out.persistence_failures, 1);
    EXPECT_TRUE(out.final_persisted);
    EXPECT_EQ(out.final_snapshot.total, 1);
    ASSERT_EQ(sink.rows.size(), 1u);
    EXPECT_EQ(sink.rows.begin()->second.total, 1);
}

TEST(CountingSessionTest, FailedFinalWriteIsReported)
{
    FakeSource src({frame_with({{100, 200}}), frame_with({{100, 170}})});
    MemorySink sink;
    sink.failures_left = 5;
    CountingSession session(directional(), src, sink, fixed_clock());
    std::atomic<bool> stop{false};
    SessionOutcome out = session.run(stop);

    EXPECT_FALSE(out.final_persisted);
    EXPECT_EQ(out.error, ErrorKind::PersistenceFailure);
    EXPECT_EQ(out.final_snapshot.total, 1);
}

TEST(CountingSessionTest, DecodeFailureStillFlushesAccumulatedCounts)
{
    FakeSource src({
        frame_with({{100, 200}}),
        frame_with({{100, 170}}),
        frame_with({{100, 160}}),
    });
    src.fail_at = 2;
    MemorySink sink;
    CountingSession session(directional(), src, sink, fixed_clock());
    std::atomic<bool> stop{false};
    SessionOutcome out = session.run(stop);

    EXPECT_EQ(out.error, ErrorKind::DecodeFailure);
    EXPECT_EQ(out.message, "corrupt packet");
    EXPECT_EQ(out.frames_processed, 2);
    EXPECT_EQ(out.final_snapshot.total, 1);
    EXPECT_TRUE(out.final_persisted);
    ASSERT_EQ(sink.rows.size(), 1u);
    EXPECT_EQ(sink.rows.begin()->second.total, 1);
    EXPECT_EQ(src.released, 1);
}

TEST(CountingSessionTest, UnavailableStreamEndsWithZeroCounts)
{
    FakeSource src({frame_with({{100, 200}})});
    src.unavailable = true;
    MemorySink sink;
    CountingSession session(directional(), src, sink, fixed_clock());
    std::atomic<bool> stop{false};
    SessionOutcome out = session.run(stop);

    EXPECT_EQ(out.error, ErrorKind::StreamUnavailable);
    EXPECT_EQ(out.frames_processed, 0);
    EXPECT_EQ(out.final_snapshot.total, 0);
    EXPECT_EQ(src.released, 1);
    EXPECT_THROW(session.run(stop), std::logic_error);
}

TEST(CountingSessionTest, StopFlagIsCheckedEveryFrame)
{
    FakeSource src({
        frame_with({{100, 200}}),
        frame_with({{100, 170}}),
        frame_with({{100, 160}}),
        frame_with({{100, 150}}),
    });
    MemorySink sink;
    CountingSession session(directional(), src, sink, fixed_clock());

    std::atomic<bool> stop{false};
    int seen = 0;
    SessionOutcome out = session.run(stop, [&](const FrameView& v) {
        ASSERT_NE(v.line, nullptr);
        EXPECT_EQ(v.line->p1.y, 180);
        if (++seen == 2) stop = true;
    });

    EXPECT_EQ(out.frames_processed, 2);
    EXPECT_EQ(out.error, ErrorKind::None);
    EXPECT_EQ(out.final_snapshot.total, 1);
    EXPECT_EQ(sink.rows.size(), 1u);
    EXPECT_EQ(src.released, 1);
}

TEST(CountingSessionTest, FailingObserverStillFlushesCounts)
{
    FakeSource src({
        frame_with({{100, 200}}),
        frame_with({{100, 170}}),
        frame_with({{100, 160}}),
    });
    MemorySink sink;
    CountingSession session(directional(), src, sink, fixed_clock());

    std::atomic<bool> stop{false};
    int seen = 0;
    SessionOutcome out = session.run(stop, [&](const FrameView&) {
        if (++seen == 2) throw std::runtime_error("display lost");
    });

    EXPECT_EQ(out.error, ErrorKind::DecodeFailure);
    EXPECT_EQ(out.message, "display lost");
    EXPECT_EQ(out.frames_processed, 2);
    EXPECT_EQ(out.final_snapshot.total, 1);
    EXPECT_TRUE(out.final_persisted);
    EXPECT_EQ(sink.attempts, 1);
    ASSERT_EQ(sink.rows.size(), 1u);
    EXPECT_EQ(sink.rows.begin()->second.total, 1);
    EXPECT_EQ(session.aggregator().state(), SessionState::Terminated);
    EXPECT_EQ(src.released, 1);
}

TEST(CountingSessionTest, FramesAfterTerminationCountNothing)
{
    FakeSource src({frame_with({{100, 200}})});
    MemorySink sink;
    CountingSession session(directional(), src, sink, fixed_clock());
    std::atomic<bool> stop{false};
    session.run(stop);

    session.process(frame_with({{100, 170}}));

    ASSERT_EQ(session.tracker().objects().size(), 1u);
    EXPECT_FALSE(session.tracker().objects()[0].counted);
    EXPECT_EQ(session.aggregator().total(), 0);
}

TEST(CountingSessionTest, UniqueIdentitiesAfterTerminationStayUncounted)
{
    AppConfig cfg = directional();
    cfg.analysis_mode = CountingMode::Unique;
    FakeSource src(std::vector<FrameDetections>{});
    MemorySink sink;
    CountingSession session(cfg, src, sink, fixed_clock());
    std::atomic<bool> stop{false};
    session.run(stop);

    session.process(frame_with({{10, 10}}));

    ASSERT_EQ(session.tracker().objects().size(), 1u);
    EXPECT_FALSE(session.tracker().objects()[0].counted);
    EXPECT_EQ(session.aggregator().total(), 0);
}
