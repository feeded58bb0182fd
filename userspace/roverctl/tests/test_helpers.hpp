// tests/test_helpers.hpp - Sandboxes and fakes shared by the unit tests
#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "provision/host.hpp"
#include "utils.hpp"

namespace roverctl {
namespace test {

// Fresh directory under /tmp, removed with everything in it
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

// Writes an executable /bin/sh script and returns its path
std::string write_script(const std::string& path, const std::string& body);

ExecResult exited(int code, std::string out = "", std::string err = "");

// CommandRunner that records every command and answers from rules.
// Rules match on the command line prefix; the most recently added wins.
// Unmatched commands succeed with no output.
class FakeRunner : public CommandRunner {
public:
    using Handler = std::function<ExecResult(const std::vector<std::string>&)>;

    void on(const std::string& prefix, Handler handler);
    void on(const std::string& prefix, int exit_code, const std::string& out = "",
            const std::string& err = "");

    ExecResult run(const std::vector<std::string>& args) override;

    // Recorded command lines, joined with spaces
    const std::vector<std::string>& calls() const { return calls_; }
    size_t count(const std::string& prefix) const;

private:
    std::vector<std::pair<std::string, Handler>> rules_;
    std::vector<std::string> calls_;
};

// The invoking user with its home replaced, for sandboxed hosts
UserInfo sandbox_user(const std::string& home = "/home/rover");

}  // namespace test
}  // namespace roverctl
