// provision/host.hpp - Target host seen by the provisioner
#pragma once

#include <string>
#include <utility>
#include <vector>
#include "../utils.hpp"

namespace roverctl {

class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual ExecResult run(const std::vector<std::string>& args) = 0;
};

// Runs commands on this machine
class SystemRunner : public CommandRunner {
public:
    explicit SystemRunner(ExecOptions opts = {}) : opts_(std::move(opts)) {}
    ExecResult run(const std::vector<std::string>& args) override;

private:
    ExecOptions opts_;
};

struct Host {
    UserInfo user;
    CommandRunner& runner;
    // Prefix for absolute paths, empty for the real root
    std::string root;
    // chown created files to `user` when running as root
    bool manage_ownership = true;

    // Expands "~" to the user's home and applies `root`
    std::string path(const std::string& p) const;
    // Best effort; logs on failure
    void give_to_user(const std::string& real_path) const;
};

}  // namespace roverctl
