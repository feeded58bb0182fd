// tests/test_helpers.cpp - Sandboxes and fakes shared by the unit tests
#include "test_helpers.hpp"

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace roverctl {
namespace test {

TempDir::TempDir() {
    char tmpl[] = "/tmp/roverctl-test-XXXXXX";
    char* dir = mkdtemp(tmpl);
    if (!dir)
        throw std::runtime_error("mkdtemp failed");
    path_ = dir;
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::string write_script(const std::string& path, const std::string& body) {
    if (!write_file(path, "#!/bin/sh\n" + body))
        throw std::runtime_error("cannot write " + path);
    if (chmod(path.c_str(), 0755) != 0)
        throw std::runtime_error("cannot chmod " + path);
    return path;
}

ExecResult exited(int code, std::string out, std::string err) {
    return ExecResult{code, std::move(out), std::move(err), false};
}

void FakeRunner::on(const std::string& prefix, Handler handler) {
    rules_.emplace_back(prefix, std::move(handler));
}

void FakeRunner::on(const std::string& prefix, int exit_code, const std::string& out,
                    const std::string& err) {
    on(prefix, [=](const std::vector<std::string>&) { return exited(exit_code, out, err); });
}

ExecResult FakeRunner::run(const std::vector<std::string>& args) {
    std::string line = join(args, " ");
    calls_.push_back(line);
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        if (starts_with(line, it->first))
            return it->second(args);
    }
    return exited(0);
}

size_t FakeRunner::count(const std::string& prefix) const {
    size_t n = 0;
    for (const auto& call : calls_) {
        if (starts_with(call, prefix))
            n++;
    }
    return n;
}

UserInfo sandbox_user(const std::string& home) {
    std::string name = "rover";
    if (struct passwd* pw = getpwuid(getuid()))
        name = pw->pw_name;
    return UserInfo{name, getuid(), getgid(), home};
}

}  // namespace test
}  // namespace roverctl
