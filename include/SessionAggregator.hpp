#pragma once
#include "CrossingEvaluator.hpp"
#include <chrono>
#include <optional>
#include <string>

enum class CountingMode { Directional, Unique };

enum class SessionState { Init, Running, Terminated };

using WallClock = std::chrono::system_clock;

/** Cumulative counters of one session at one instant. */
struct SessionSnapshot
{
    std::string           stream_id;
    std::string           object_type;
    int                   dir1  = 0;
    int                   dir2  = 0;
    int                   total = 0;
    WallClock::time_point session_start;
    WallClock::time_point session_end;
};

/** DD-MM-YYYY HH:MM:SS in local time, the key format of stored sessions. */
std::string format_session_time(WallClock::time_point tp);

class SessionAggregator
{
public:
    SessionAggregator(std::string           stream_id,
                      std::string           object_type,
                      CountingMode          mode,
                      std::chrono::seconds  record_interval,
                      WallClock::time_point session_start);

    /** Directional mode: count one crossing in its bucket. */
    bool record(const CrossingEvent& ev);

    /** Unique mode: count an identity seen for the first time. */
    bool register_unique(int track_id);

    /** Periodic flush: a snapshot when `record_interval` has elapsed since the last one. */
    std::optional<SessionSnapshot> tick(WallClock::time_point now);

    /** Final flush. Throws std::logic_error when already terminated. */
    SessionSnapshot terminate(WallClock::time_point now);

    SessionSnapshot snapshot() const;

    SessionState state() const { return state_; }
    CountingMode mode() const { return mode_; }
    int dir1() const { return dir1_; }
    int dir2() const { return dir2_; }
    int total() const { return mode_ == CountingMode::Directional ? dir1_ + dir2_ : unique_total_; }
    WallClock::time_point session_start() const { return session_start_; }
    WallClock::time_point session_end() const { return session_end_; }

private:
    bool accepting();

    std::string           stream_id_;
    std::string           object_type_;
    CountingMode          mode_;
    std::chrono::seconds  record_interval_;
    WallClock::time_point session_start_;
    WallClock::time_point session_end_;
    WallClock::time_point last_flush_;
    SessionState          state_ = SessionState::Init;

    int dir1_ = 0, dir2_ = 0;
    int unique_total_ = 0;
};
