// conf/sync_config.hpp - settings for `roverctl sync`
#pragma once

#include <string>
#include <vector>

namespace roverctl {

struct SyncSettings {
    std::string remote;
    std::string dest;
    unsigned interval_sec;
    unsigned timeout_sec;
    bool verify = false;
    std::string scp;
    std::vector<std::string> ssh_options;

    static SyncSettings defaults();

    // Applies one key=value pair. Unknown keys and bad values return false.
    bool set(const std::string& key, const std::string& value);

    // Reads a key=value file; '#' starts a comment line
    bool load_file(const std::string& path);

    // File name component of `remote`
    std::string remote_name() const;
};

}  // namespace roverctl
