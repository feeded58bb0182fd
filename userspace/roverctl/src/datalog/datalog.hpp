// datalog/datalog.hpp - rover_data_log.json reader
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace roverctl {

class DataLogError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Position {
    double x = 0.0;
    double y = 0.0;
    double heading = 0.0;
};

struct Obstacles {
    bool front = false;
    bool back = false;
    bool left = false;
    bool right = false;

    bool any() const { return front || back || left || right; }
};

struct DataLogEntry {
    std::string timestamp;
    Position position;
    std::optional<double> temperature;
    std::optional<double> humidity;
    std::optional<double> soil_ph;
    std::optional<double> soil_voltage;
    Obstacles obstacles;
    std::string action = "unknown";
};

struct DataLogSummary {
    size_t entries = 0;
    std::string first_timestamp;
    std::string last_timestamp;
    Position last_position;
    std::map<std::string, size_t> actions;
    size_t entries_with_obstacles = 0;
};

class DataLog {
public:
    // Accepts a JSON array of entries or one JSON object per line
    static DataLog parse(const std::string& text);
    static DataLog load(const std::string& path);

    const std::vector<DataLogEntry>& entries() const { return entries_; }

    DataLogSummary summarize() const;

    // timestamp,x,y,heading,temperature,humidity,soil_ph,action
    void export_csv(std::ostream& out) const;

private:
    std::vector<DataLogEntry> entries_;
};

}  // namespace roverctl
