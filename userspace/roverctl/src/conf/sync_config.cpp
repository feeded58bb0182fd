// conf/sync_config.cpp - key=value settings for `roverctl sync`
#include "sync_config.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <sstream>

namespace roverctl {

static bool parse_seconds(const std::string& value, unsigned& out) {
    try {
        size_t used = 0;
        unsigned long v = std::stoul(value, &used);
        if (used != value.size() || v == 0 || v > 86400)
            return false;
        out = static_cast<unsigned>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static bool parse_bool(const std::string& value, bool& out) {
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

SyncSettings SyncSettings::defaults() {
    SyncSettings s;
    s.remote = SYNC_REMOTE;
    s.dest = SYNC_DEST;
    s.interval_sec = SYNC_INTERVAL_SEC;
    s.timeout_sec = SYNC_TIMEOUT_SEC;
    s.scp = SCP_PATH;
    return s;
}

bool SyncSettings::set(const std::string& key, const std::string& value) {
    if (key == "remote") {
        // scp needs host:path, a bare path would turn this into a local copy
        if (value.find(':') == std::string::npos)
            return false;
        remote = value;
        return true;
    } else if (key == "dest") {
        if (value.empty())
            return false;
        dest = value;
        return true;
    } else if (key == "interval") {
        return parse_seconds(value, interval_sec);
    } else if (key == "timeout") {
        return parse_seconds(value, timeout_sec);
    } else if (key == "verify") {
        return parse_bool(value, verify);
    } else if (key == "scp") {
        if (value.empty())
            return false;
        scp = value;
        return true;
    } else if (key == "ssh_option") {
        if (value.empty())
            return false;
        ssh_options.push_back(value);
        return true;
    }
    return false;
}

bool SyncSettings::load_file(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        LOGE("Cannot read sync config %s", path.c_str());
        return false;
    }

    std::istringstream iss(*content);
    std::string line;
    int lineno = 0;
    bool ok = true;
    while (std::getline(iss, line)) {
        lineno++;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            LOGE("%s:%d: expected key=value", path.c_str(), lineno);
            ok = false;
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (!set(key, val)) {
            LOGE("%s:%d: invalid setting %s=%s", path.c_str(), lineno, key.c_str(), val.c_str());
            ok = false;
        } else {
            LOGD("Loaded sync setting %s = %s", key.c_str(), val.c_str());
        }
    }

    return ok;
}

std::string SyncSettings::remote_name() const {
    std::string path = remote.substr(remote.rfind(':') + 1);
    size_t slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return name.empty() ? DATA_LOG_NAME : name;
}

}  // namespace roverctl
