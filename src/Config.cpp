#include "Config.hpp"
#include "ClassCatalog.hpp"
#include "Errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

using nlohmann::json;

// -----------------------------------------------------------------------------
// enum parsing

CountingMode parse_mode(const std::string& s)
{
    if (s == "directional") return CountingMode::Directional;
    if (s == "unique")      return CountingMode::Unique;
    throw ConfigError("unknown analysis_mode '" + s + "'");
}

Orientation parse_orientation(const std::string& s)
{
    if (s == "horizontal") return Orientation::Horizontal;
    if (s == "vertical")   return Orientation::Vertical;
    if (s == "diagonal")   return Orientation::Diagonal;
    throw ConfigError("unknown line orientation '" + s + "'");
}

DirectionMode parse_direction(const std::string& s)
{
    if (s == "vertical")   return DirectionMode::Vertical;
    if (s == "horizontal") return DirectionMode::Horizontal;
    if (s == "diag1")      return DirectionMode::Diag1;
    if (s == "diag2")      return DirectionMode::Diag2;
    throw ConfigError("unknown direction_mode '" + s + "'");
}

CountingAlgorithm parse_algorithm(const std::string& s)
{
    if (s == "standard")  return CountingAlgorithm::Standard;
    if (s == "threshold") return CountingAlgorithm::Threshold;
    throw ConfigError("unknown counting_algorithm '" + s + "'");
}

const char* to_string(CountingMode m)
{
    return m == CountingMode::Directional ? "directional" : "unique";
}

const char* to_string(Orientation o)
{
    switch (o) {
    case Orientation::Horizontal: return "horizontal";
    case Orientation::Vertical:   return "vertical";
    case Orientation::Diagonal:   return "diagonal";
    }
    return "unknown";
}

const char* to_string(DirectionMode d)
{
    switch (d) {
    case DirectionMode::Vertical:   return "vertical";
    case DirectionMode::Horizontal: return "horizontal";
    case DirectionMode::Diag1:      return "diag1";
    case DirectionMode::Diag2:      return "diag2";
    }
    return "unknown";
}

const char* to_string(CountingAlgorithm a)
{
    return a == CountingAlgorithm::Threshold ? "threshold" : "standard";
}

// -----------------------------------------------------------------------------
// JSON overlay

void apply_json(AppConfig& cfg, const json& j)
{
    try {
        if (j.contains("rtsp_url"))
            cfg.stream_url = j["rtsp_url"].get<std::string>();
        if (j.contains("object_type"))
            cfg.object_type = j["object_type"].get<std::string>();
        if (j.contains("analysis_mode"))
            cfg.analysis_mode = parse_mode(j["analysis_mode"].get<std::string>());
        if (j.contains("line_options")) {
            const auto& jl = j["line_options"];
            if (jl.contains("orientation"))
                cfg.line.orientation = parse_orientation(jl["orientation"].get<std::string>());
            if (jl.contains("position"))
                cfg.line.position = jl["position"].get<double>();
            if (jl.contains("direction_mode"))
                cfg.line.mode = parse_direction(jl["direction_mode"].get<std::string>());
        }
        if (j.contains("resolution_width"))
            cfg.resolution_width = j["resolution_width"].get<int>();
        if (j.contains("resolution_height"))
            cfg.resolution_height = j["resolution_height"].get<int>();
        if (j.contains("counting_algorithm"))
            cfg.counting_algorithm = parse_algorithm(j["counting_algorithm"].get<std::string>());
        if (j.contains("min_displacement"))
            cfg.min_displacement = j["min_displacement"].get<int>();
        if (j.contains("record_interval"))
            cfg.record_interval = j["record_interval"].get<int>();
        if (j.contains("database"))
            cfg.database = j["database"].get<std::string>();
        if (j.contains("model_path"))
            cfg.model_path = j["model_path"].get<std::string>();
        if (j.contains("confidence_threshold"))
            cfg.confidence_threshold = j["confidence_threshold"].get<float>();
        if (j.contains("nms_threshold"))
            cfg.nms_threshold = j["nms_threshold"].get<float>();
        if (j.contains("replay_file"))
            cfg.replay_file = j["replay_file"].get<std::string>();
        if (j.contains("display"))
            cfg.display = j["display"].get<bool>();
        if (j.contains("verbose"))
            cfg.verbose = j["verbose"].get<bool>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad config value: ") + e.what());
    }
}

AppConfig load_config(const std::string& path)
{
    AppConfig cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    std::cout << "[config] loading " << path << std::endl;
    std::ifstream ifs(path);
    json j;
    try {
        ifs >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    if (!j.is_object())
        throw ConfigError(path + " must hold a JSON object");

    apply_json(cfg, j);
    return cfg;
}

void validate(AppConfig& cfg)
{
    if (cfg.stream_url.empty())
        throw ConfigError("no stream url configured");
    if (!coco::class_index(cfg.object_type))
        throw ConfigError("object type '" + cfg.object_type + "' is not a known class");
    if (cfg.line.position < 0.0 || cfg.line.position > 1.0)
        throw ConfigError("line position must be within [0, 1]");
    if (cfg.min_displacement <= 0)
        throw ConfigError("min_displacement must be a positive number of pixels");
    if (cfg.record_interval <= 0)
        throw ConfigError("record_interval must be a positive number of seconds");
    if (cfg.resolution_width <= 0 || cfg.resolution_height <= 0)
        throw ConfigError("resolution must be positive");

    cfg.line.mode = resolve_direction(cfg.line.orientation, cfg.line.mode);
}
