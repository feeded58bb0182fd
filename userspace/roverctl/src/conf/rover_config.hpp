// conf/rover_config.hpp - rover_config.json model
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace roverctl {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CameraResolution {
    int64_t width;
    int64_t height;

    bool operator==(const CameraResolution& other) const {
        return width == other.width && height == other.height;
    }
};

struct RoverConfig {
    bool auto_study_enabled;
    int64_t study_interval;
    int64_t default_speed;
    bool ir_priority;
    bool log_to_file;
    CameraResolution camera_resolution;
    int64_t min_obstacle_area;

    // Keys this tool does not know about, kept so a rewrite loses nothing
    nlohmann::json extra = nlohmann::json::object();

    static RoverConfig defaults();

    // Keys present in `doc` override the defaults
    static RoverConfig from_json(const nlohmann::json& doc);
    // Field order matches the file written at setup time
    nlohmann::ordered_json to_json() const;

    // Missing file yields the defaults
    static RoverConfig load(const std::string& path);
    bool save(const std::string& path) const;

    // Empty when the values are usable by the rover
    std::vector<std::string> validate() const;

    bool operator==(const RoverConfig& other) const;
};

}  // namespace roverctl
