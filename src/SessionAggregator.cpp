#include "SessionAggregator.hpp"
#include <ctime>
#include <stdexcept>
#include <utility>

using namespace std;

string format_session_time(WallClock::time_point tp)
{
    time_t t = WallClock::to_time_t(tp);
    tm local{};
    localtime_r(&t, &local);
    char buf[32];
    strftime(buf, sizeof(buf), "%d-%m-%Y %H:%M:%S", &local);
    return buf;
}

SessionAggregator::SessionAggregator(string stream_id, string object_type,
                                     CountingMode mode, chrono::seconds record_interval,
                                     WallClock::time_point session_start)
    : stream_id_(move(stream_id)), object_type_(move(object_type)), mode_(mode),
      record_interval_(record_interval), session_start_(session_start),
      session_end_(session_start), last_flush_(session_start) {}

bool SessionAggregator::accepting()
{
    if (state_ == SessionState::Terminated) return false;
    state_ = SessionState::Running;
    return true;
}

bool SessionAggregator::record(const CrossingEvent& ev)
{
    if (mode_ != CountingMode::Directional || !accepting()) return false;
    if (ev.bucket == Bucket::First) ++dir1_;
    else                            ++dir2_;
    return true;
}

bool SessionAggregator::register_unique(int /*track_id*/)
{
    if (mode_ != CountingMode::Unique || !accepting()) return false;
    ++unique_total_;
    return true;
}

optional<SessionSnapshot> SessionAggregator::tick(WallClock::time_point now)
{
    if (!accepting()) return nullopt;
    if (now - last_flush_ < record_interval_) return nullopt;

    last_flush_  = now;
    session_end_ = now;
    return snapshot();
}

SessionSnapshot SessionAggregator::terminate(WallClock::time_point now)
{
    if (state_ == SessionState::Terminated)
        throw logic_error("session for " + stream_id_ + " already terminated");

    state_       = SessionState::Terminated;
    session_end_ = now;
    return snapshot();
}

SessionSnapshot SessionAggregator::snapshot() const
{
    SessionSnapshot s;
    s.stream_id     = stream_id_;
    s.object_type   = object_type_;
    s.dir1          = mode_ == CountingMode::Directional ? dir1_ : 0;
    s.dir2          = mode_ == CountingMode::Directional ? dir2_ : 0;
    s.total         = total();
    s.session_start = session_start_;
    s.session_end   = session_end_;
    return s;
}
