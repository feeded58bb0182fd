// datalog/datalog.cpp - rover_data_log.json reader
#include "datalog.hpp"
#include "../utils.hpp"

#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace roverctl {

static std::optional<double> opt_number(const json& obj, const char* key, size_t index) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::nullopt;
    if (!it->is_number())
        throw DataLogError("entry " + std::to_string(index) + ": '" + key + "' is not a number");
    return it->get<double>();
}

static double number_or_zero(const json& obj, const char* key, size_t index) {
    return opt_number(obj, key, index).value_or(0.0);
}

static bool flag(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_boolean() && it->get<bool>();
}

static DataLogEntry parse_entry(const json& obj, size_t index) {
    if (!obj.is_object())
        throw DataLogError("entry " + std::to_string(index) + " is not an object");

    DataLogEntry entry;

    auto ts = obj.find("timestamp");
    if (ts != obj.end() && ts->is_string())
        entry.timestamp = ts->get<std::string>();

    auto pos = obj.find("position");
    if (pos != obj.end() && pos->is_object()) {
        entry.position.x = number_or_zero(*pos, "x", index);
        entry.position.y = number_or_zero(*pos, "y", index);
        entry.position.heading = number_or_zero(*pos, "heading", index);
    }

    entry.temperature = opt_number(obj, "temperature", index);
    entry.humidity = opt_number(obj, "humidity", index);
    entry.soil_ph = opt_number(obj, "soil_ph", index);
    entry.soil_voltage = opt_number(obj, "soil_voltage", index);

    auto obs = obj.find("obstacles");
    if (obs != obj.end() && obs->is_object()) {
        entry.obstacles.front = flag(*obs, "front");
        entry.obstacles.back = flag(*obs, "back");
        entry.obstacles.left = flag(*obs, "left");
        entry.obstacles.right = flag(*obs, "right");
    }

    auto action = obj.find("action");
    if (action != obj.end() && action->is_string())
        entry.action = action->get<std::string>();

    return entry;
}

DataLog DataLog::parse(const std::string& text) {
    DataLog log;
    std::string body = trim(text);
    if (body.empty())
        return log;

    if (body[0] == '[') {
        json doc = json::parse(body, nullptr, false);
        if (doc.is_discarded())
            throw DataLogError("data log is not valid JSON");
        for (size_t i = 0; i < doc.size(); i++) {
            log.entries_.push_back(parse_entry(doc[i], i));
        }
        return log;
    }

    // A single pretty-printed entry
    json whole = json::parse(body, nullptr, false);
    if (!whole.is_discarded()) {
        log.entries_.push_back(parse_entry(whole, 0));
        return log;
    }

    // JSON lines
    std::istringstream iss(body);
    std::string line;
    size_t lineno = 0;
    while (std::getline(iss, line)) {
        lineno++;
        line = trim(line);
        if (line.empty())
            continue;
        json doc = json::parse(line, nullptr, false);
        if (doc.is_discarded())
            throw DataLogError("line " + std::to_string(lineno) + " is not valid JSON");
        log.entries_.push_back(parse_entry(doc, log.entries_.size()));
    }
    return log;
}

DataLog DataLog::load(const std::string& path) {
    auto content = read_file(path);
    if (!content)
        throw DataLogError("cannot read " + path);
    return parse(*content);
}

DataLogSummary DataLog::summarize() const {
    DataLogSummary summary;
    summary.entries = entries_.size();
    if (entries_.empty())
        return summary;

    summary.first_timestamp = entries_.front().timestamp;
    summary.last_timestamp = entries_.back().timestamp;
    summary.last_position = entries_.back().position;

    for (const auto& entry : entries_) {
        summary.actions[entry.action]++;
        if (entry.obstacles.any())
            summary.entries_with_obstacles++;
    }
    return summary;
}

// Shortest round-trip form, e.g. 25.0 and 12.34
static std::string csv_number(double v) {
    return json(v).dump();
}

static std::string csv_optional(const std::optional<double>& v) {
    return v ? csv_number(*v) : "";
}

static std::string csv_text(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos)
        return s;
    std::string quoted = "\"";
    for (char c : s) {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void DataLog::export_csv(std::ostream& out) const {
    out << "timestamp,x,y,heading,temperature,humidity,soil_ph,action\r\n";
    for (const auto& e : entries_) {
        out << csv_text(e.timestamp) << ',' << csv_number(e.position.x) << ','
            << csv_number(e.position.y) << ',' << csv_number(e.position.heading) << ','
            << csv_optional(e.temperature) << ',' << csv_optional(e.humidity) << ','
            << csv_optional(e.soil_ph) << ',' << csv_text(e.action) << "\r\n";
    }
}

}  // namespace roverctl
