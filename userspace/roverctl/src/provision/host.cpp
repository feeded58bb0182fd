// provision/host.cpp - Target host seen by the provisioner
#include "host.hpp"
#include "../log.hpp"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace roverctl {

ExecResult SystemRunner::run(const std::vector<std::string>& args) {
    LOGD("exec: %s", join(args, " ").c_str());
    auto result = exec_command(args, opts_);
    LOGV("exit %d", result.exit_code);
    return result;
}

std::string Host::path(const std::string& p) const {
    std::string expanded = expand_home(p, user.home);
    if (root.empty() || expanded.empty() || expanded[0] != '/')
        return expanded;

    std::string prefix = root;
    while (ends_with(prefix, "/"))
        prefix.pop_back();
    return prefix + expanded;
}

void Host::give_to_user(const std::string& real_path) const {
    if (!manage_ownership || geteuid() != 0)
        return;
    if (chown(real_path.c_str(), user.uid, user.gid) != 0) {
        LOGW("Failed to chown %s to %s: %s", real_path.c_str(), user.name.c_str(),
             strerror(errno));
    }
}

}  // namespace roverctl
