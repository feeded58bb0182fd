// conf/rover_config.cpp - rover_config.json load/save/validate
#include "rover_config.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <array>

using json = nlohmann::json;

namespace roverctl {

static constexpr std::array<const char*, 7> KNOWN_KEYS = {
    "auto_study_enabled", "study_interval", "default_speed",     "ir_priority",
    "log_to_file",        "camera_resolution", "min_obstacle_area",
};

static bool is_known_key(const std::string& key) {
    for (const char* k : KNOWN_KEYS) {
        if (key == k)
            return true;
    }
    return false;
}

static bool get_bool(const json& doc, const char* key, bool fallback) {
    auto it = doc.find(key);
    if (it == doc.end())
        return fallback;
    if (!it->is_boolean())
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    return it->get<bool>();
}

static int64_t get_int(const json& doc, const char* key, int64_t fallback) {
    auto it = doc.find(key);
    if (it == doc.end())
        return fallback;
    if (!it->is_number_integer())
        throw ConfigError(std::string("'") + key + "' must be an integer");
    return it->get<int64_t>();
}

RoverConfig RoverConfig::defaults() {
    RoverConfig cfg;
    cfg.auto_study_enabled = DEFAULT_AUTO_STUDY_ENABLED;
    cfg.study_interval = DEFAULT_STUDY_INTERVAL;
    cfg.default_speed = DEFAULT_SPEED;
    cfg.ir_priority = DEFAULT_IR_PRIORITY;
    cfg.log_to_file = DEFAULT_LOG_TO_FILE;
    cfg.camera_resolution = {DEFAULT_CAMERA_WIDTH, DEFAULT_CAMERA_HEIGHT};
    cfg.min_obstacle_area = DEFAULT_MIN_OBSTACLE_AREA;
    return cfg;
}

RoverConfig RoverConfig::from_json(const json& doc) {
    if (!doc.is_object())
        throw ConfigError("rover config must be a JSON object");

    RoverConfig cfg = defaults();
    cfg.auto_study_enabled = get_bool(doc, "auto_study_enabled", cfg.auto_study_enabled);
    cfg.study_interval = get_int(doc, "study_interval", cfg.study_interval);
    cfg.default_speed = get_int(doc, "default_speed", cfg.default_speed);
    cfg.ir_priority = get_bool(doc, "ir_priority", cfg.ir_priority);
    cfg.log_to_file = get_bool(doc, "log_to_file", cfg.log_to_file);
    cfg.min_obstacle_area = get_int(doc, "min_obstacle_area", cfg.min_obstacle_area);

    auto res = doc.find("camera_resolution");
    if (res != doc.end()) {
        if (!res->is_array() || res->size() != 2 || !(*res)[0].is_number_integer() ||
            !(*res)[1].is_number_integer()) {
            throw ConfigError("'camera_resolution' must be [width, height]");
        }
        cfg.camera_resolution = {(*res)[0].get<int64_t>(), (*res)[1].get<int64_t>()};
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!is_known_key(it.key())) {
            cfg.extra[it.key()] = it.value();
        }
    }

    return cfg;
}

nlohmann::ordered_json RoverConfig::to_json() const {
    nlohmann::ordered_json doc;
    doc["auto_study_enabled"] = auto_study_enabled;
    doc["study_interval"] = study_interval;
    doc["default_speed"] = default_speed;
    doc["ir_priority"] = ir_priority;
    doc["log_to_file"] = log_to_file;
    doc["camera_resolution"] = {camera_resolution.width, camera_resolution.height};
    doc["min_obstacle_area"] = min_obstacle_area;
    for (auto it = extra.begin(); it != extra.end(); ++it) {
        doc[it.key()] = it.value();
    }
    return doc;
}

RoverConfig RoverConfig::load(const std::string& path) {
    if (!is_regular_file(path)) {
        LOGD("No rover config at %s, using defaults", path.c_str());
        return defaults();
    }

    auto content = read_file(path);
    if (!content)
        throw ConfigError("cannot read " + path);

    json doc = json::parse(*content, nullptr, false);
    if (doc.is_discarded())
        throw ConfigError(path + " is not valid JSON");

    return from_json(doc);
}

bool RoverConfig::save(const std::string& path) const {
    return write_file_atomic(path, to_json().dump(2) + "\n");
}

std::vector<std::string> RoverConfig::validate() const {
    std::vector<std::string> problems;
    if (study_interval <= 0)
        problems.push_back("study_interval must be positive");
    if (default_speed < 0 || default_speed > 100)
        problems.push_back("default_speed must be within 0..100");
    if (camera_resolution.width <= 0 || camera_resolution.height <= 0)
        problems.push_back("camera_resolution components must be positive");
    if (min_obstacle_area < 0)
        problems.push_back("min_obstacle_area must not be negative");
    return problems;
}

bool RoverConfig::operator==(const RoverConfig& other) const {
    return auto_study_enabled == other.auto_study_enabled &&
           study_interval == other.study_interval && default_speed == other.default_speed &&
           ir_priority == other.ir_priority && log_to_file == other.log_to_file &&
           camera_resolution == other.camera_resolution &&
           min_obstacle_area == other.min_obstacle_area && extra == other.extra;
}

}  // namespace roverctl
