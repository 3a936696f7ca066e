#pragma once
#include "CrossingEvaluator.hpp"
#include "SessionAggregator.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct AppConfig
{
    std::string       stream_url;                 // stream identity, the store key
    std::string       object_type        = "car";
    CountingMode      analysis_mode      = CountingMode::Unique;
    CountingLine      line{};
    int               resolution_width   = 640;   // display window
    int               resolution_height  = 360;
    CountingAlgorithm counting_algorithm = CountingAlgorithm::Standard;
    int               min_displacement   = 10;    // pixels
    int               record_interval    = 60;    // seconds
    std::string       database           = "analytics.db";
    std::string       model_path         = "yolo11n.onnx";
    float             confidence_threshold = 0.5f;
    float             nms_threshold        = 0.4f;
    std::string       replay_file;                // detections JSON instead of a model
    bool              display            = false;
    bool              verbose            = false;
};

/** Defaults overlaid with `path`; a missing file leaves the defaults. Throws ConfigError. */
AppConfig load_config(const std::string& path);

/** Overlay the keys present in `j` onto `cfg`. Throws ConfigError on bad types or values. */
void apply_json(AppConfig& cfg, const nlohmann::json& j);

/** Reject out-of-range values and unknown labels; resolves the direction mode. */
void validate(AppConfig& cfg);

// ─── enum <-> config string ───────────────────────────────────────
CountingMode      parse_mode(const std::string& s);
Orientation       parse_orientation(const std::string& s);
DirectionMode     parse_direction(const std::string& s);
CountingAlgorithm parse_algorithm(const std::string& s);

const char* to_string(CountingMode m);
const char* to_string(Orientation o);
const char* to_string(DirectionMode d);
const char* to_string(CountingAlgorithm a);
