#include "Config.hpp"
#include "CountingSession.hpp"
#include "DetectionSource.hpp"
#include "Errors.hpp"
#include "Overlay.hpp"
#include "SessionStore.hpp"
#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>

namespace {

// The only state a signal handler may touch
std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop = true; }

// -----------------------------------------------------------------------------
// Command-line overrides on top of the JSON launch file

struct RunOptions
{
    std::string config_path = "launch_config.json";
    std::optional<std::string> stream, object, mode, orientation, direction, algorithm;
    std::optional<double> position;
    std::optional<int> min_disp, interval;
    std::optional<std::string> db, model, replay;
    bool display = false;
    bool verbose = false;
};

AppConfig resolve_config(const RunOptions& o)
{
    AppConfig cfg = load_config(o.config_path);
    if (o.stream)      cfg.stream_url = *o.stream;
    if (o.object)      cfg.object_type = *o.object;
    if (o.mode)        cfg.analysis_mode = parse_mode(*o.mode);
    if (o.orientation) cfg.line.orientation = parse_orientation(*o.orientation);
    if (o.position)    cfg.line.position = *o.position;
    if (o.direction)   cfg.line.mode = parse_direction(*o.direction);
    if (o.algorithm)   cfg.counting_algorithm = parse_algorithm(*o.algorithm);
    if (o.min_disp)    cfg.min_displacement = *o.min_disp;
    if (o.interval)    cfg.record_interval = *o.interval;
    if (o.db)          cfg.database = *o.db;
    if (o.model)       cfg.model_path = *o.model;
    if (o.replay)      cfg.replay_file = *o.replay;
    if (o.display)     cfg.display = true;
    if (o.verbose)     cfg.verbose = true;
    validate(cfg);
    return cfg;
}

int exit_code(ErrorKind k)
{
    switch (k) {
    case ErrorKind::None:               return 0;
    case ErrorKind::StreamUnavailable:  return 2;
    case ErrorKind::DecodeFailure:      return 3;
    case ErrorKind::PersistenceFailure: return 4;
    }
    return 1;
}

// -----------------------------------------------------------------------------

int run_session(const RunOptions& opts)
{
    AppConfig cfg = resolve_config(opts);
    SessionStore store(cfg.database);

    std::unique_ptr<DetectionSource> source;
    if (!cfg.replay_file.empty())
        source = std::make_unique<ReplayDetectionSource>(cfg.replay_file);
    else
        source = std::make_unique<VideoDetectionSource>(cfg.stream_url, cfg.model_path,
                                                        cfg.confidence_threshold,
                                                        cfg.nms_threshold);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    CountingSession session(cfg, *source, store);
    SessionOutcome out;
    if (cfg.display) {
        OverlayWindow window(cfg, g_stop);
        out = session.run(g_stop, [&window](const FrameView& v) { window(v); });
    } else {
        out = session.run(g_stop);
    }

    const SessionSnapshot& s = out.final_snapshot;
    std::cout << "Session ended: " << format_session_time(s.session_end) << "\n";
    if (cfg.analysis_mode == CountingMode::Directional) {
        Orientation o = cfg.line.orientation;
        std::cout << "Counted " << s.total << " objects ("
                  << bucket_label(o, Bucket::First) << ": " << s.dir1 << ", "
                  << bucket_label(o, Bucket::Second) << ": " << s.dir2 << ")\n";
    } else {
        std::cout << "Counted " << s.total << " objects\n";
    }
    std::cout << "Frames processed: " << out.frames_processed << "\n";
    if (out.error != ErrorKind::None)
        std::cerr << "Session ended with " << error_kind_name(out.error)
                  << ": " << out.message << std::endl;
    return exit_code(out.error);
}

int list_sessions(const std::string& db, const std::string& stream)
{
    SessionStore store(db);
    auto rows = stream.empty() ? store.sessions() : store.sessions(stream);
    std::cout << "Analytics:\n";
    for (const auto& r : rows) {
        std::cout << "Stream: " << r.stream_url << ", Object: " << r.object_type
                  << ", Dir1: " << r.direction1 << ", Dir2: " << r.direction2
                  << ", Total: " << r.total << ", Session Start: " << r.session_start
                  << ", Session End: " << r.session_end << "\n";
    }
    return 0;
}

int list_streams(const std::string& db)
{
    SessionStore store(db);
    int i = 0;
    for (const auto& url : store.stream_urls())
        std::cout << ++i << ". " << url << "\n";
    return 0;
}

} // namespace

// -----------------------------------------------------------------------------

int main(int argc, char** argv)
{
    CLI::App app{"Line-crossing and unique object counter"};
    app.require_subcommand(1);

    RunOptions opts;
    auto* run = app.add_subcommand("run", "Count objects on a stream");
    run->add_option("--config", opts.config_path, "JSON launch settings");
    run->add_option("--stream", opts.stream, "Stream URL or video file");
    run->add_option("--object", opts.object, "Object class to count (e.g. person, car)");
    run->add_option("--mode", opts.mode, "directional | unique");
    run->add_option("--orientation", opts.orientation, "horizontal | vertical | diagonal");
    run->add_option("--position", opts.position, "Relative line position (0.0 - 1.0)");
    run->add_option("--direction", opts.direction, "diag1 | diag2 for diagonal lines");
    run->add_option("--algorithm", opts.algorithm, "standard | threshold");
    run->add_option("--min-displacement", opts.min_disp, "Threshold in pixels");
    run->add_option("--interval", opts.interval, "Record interval in seconds");
    run->add_option("--db", opts.db, "SQLite analytics database");
    run->add_option("--model", opts.model, "YOLO ONNX model");
    run->add_option("--replay", opts.replay, "Replay detections from JSON instead of a model");
    run->add_flag("--display", opts.display, "Show the overlay window");
    run->add_flag("--verbose", opts.verbose, "Log every crossing decision");

    std::string db = "analytics.db", stream;
    auto* sessions = app.add_subcommand("sessions", "List stored sessions");
    sessions->add_option("--db", db, "SQLite analytics database");
    sessions->add_option("--stream", stream, "Only this stream");

    auto* streams = app.add_subcommand("streams", "List previously used streams");
    streams->add_option("--db", db, "SQLite analytics database");

    CLI11_PARSE(app, argc, argv);

    try {
        if (*run)      return run_session(opts);
        if (*sessions) return list_sessions(db, stream);
        if (*streams)  return list_streams(db);
    } catch (const ConfigError& e) {
        std::cerr << "[config] " << e.what() << std::endl;
        return 1;
    } catch (const PersistenceError& e) {
        std::cerr << "[store] " << e.what() << std::endl;
        return 4;
    } catch (const std::exception& e) {
        std::cerr << "[flowcount] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
