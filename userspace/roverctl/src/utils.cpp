#include "utils.hpp"
#include "log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <pwd.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <vector>

namespace roverctl {

bool ensure_dir_exists(const std::string& path, mode_t mode) {
    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        if (!S_ISDIR(st.st_mode)) {
            LOGE("%s exists and is not a directory", path.c_str());
            return false;
        }
        return true;
    }

    // Create directory recursively
    std::string current;
    for (char c : path) {
        current += c;
        if (c == '/' && current.size() > 1) {
            if (mkdir(current.c_str(), mode) != 0 && errno != EEXIST) {
                LOGE("Failed to create directory %s: %s", current.c_str(), strerror(errno));
                return false;
            }
        }
    }

    if (mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
        LOGE("Failed to create directory %s: %s", path.c_str(), strerror(errno));
        return false;
    }

    return true;
}

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_regular_file(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delim)) {
        result.push_back(item);
    }
    return result;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string format_clock(std::chrono::system_clock::time_point tp) {
    time_t t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_info;
    localtime_r(&t, &tm_info);
    char buf[16];
    strftime(buf, sizeof(buf), "%H:%M:%S", &tm_info);
    return buf;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs)
        return std::nullopt;

    std::stringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

bool write_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path);
    if (!ofs)
        return false;
    ofs << content;
    return static_cast<bool>(ofs);
}

bool write_file_atomic(const std::string& path, const std::string& content, mode_t mode) {
    std::string tmp = path + ".tmp." + std::to_string(getpid());

    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        LOGE("Failed to create %s: %s", tmp.c_str(), strerror(errno));
        return false;
    }

    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            LOGE("Failed to write %s: %s", tmp.c_str(), strerror(errno));
            close(fd);
            unlink(tmp.c_str());
            return false;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }

    if (fsync(fd) != 0) {
        LOGW("fsync %s: %s", tmp.c_str(), strerror(errno));
    }
    close(fd);

    // open() honours umask, the final file should not
    chmod(tmp.c_str(), mode);

    if (rename(tmp.c_str(), path.c_str()) != 0) {
        LOGE("Failed to rename %s to %s: %s", tmp.c_str(), path.c_str(), strerror(errno));
        unlink(tmp.c_str());
        return false;
    }

    return true;
}

std::optional<UserInfo> lookup_user(const std::string& name) {
    struct passwd pwd;
    struct passwd* found = nullptr;
    std::vector<char> buf(16384);

    int ret = getpwnam_r(name.c_str(), &pwd, buf.data(), buf.size(), &found);
    if (ret != 0 || !found) {
        return std::nullopt;
    }

    return UserInfo{found->pw_name, found->pw_uid, found->pw_gid,
                    found->pw_dir ? found->pw_dir : ""};
}

std::optional<UserInfo> resolve_target_user() {
    for (const char* var : {"SUDO_USER", "USER"}) {
        const char* value = getenv(var);
        if (value && *value) {
            auto user = lookup_user(value);
            if (user)
                return user;
            LOGW("%s=%s is not a known user", var, value);
        }
    }

    struct passwd pwd;
    struct passwd* found = nullptr;
    std::vector<char> buf(16384);
    if (getpwuid_r(getuid(), &pwd, buf.data(), buf.size(), &found) != 0 || !found) {
        return std::nullopt;
    }
    return UserInfo{found->pw_name, found->pw_uid, found->pw_gid,
                    found->pw_dir ? found->pw_dir : ""};
}

std::string expand_home(const std::string& path, const std::string& home) {
    if (path == "~")
        return home;
    if (starts_with(path, "~/"))
        return home + path.substr(1);
    return path;
}

static void close_pipe(int p[2]) {
    if (p[0] >= 0)
        close(p[0]);
    if (p[1] >= 0)
        close(p[1]);
}

ExecResult exec_command(const std::vector<std::string>& args, const ExecOptions& opts) {
    ExecResult result{-1, "", "", false};

    if (args.empty())
        return result;

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        LOGE("pipe: %s", strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        LOGE("fork: %s", strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process: own process group so a timeout can kill helpers too
        setpgid(0, 0);

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        if (!opts.workdir.empty()) {
            if (chdir(opts.workdir.c_str()) != 0) {
                _exit(127);
            }
        }

        std::vector<char*> c_args;
        for (const auto& arg : args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    // Parent process
    setpgid(pid, pid);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    struct pollfd fds[2] = {
        {stdout_pipe[0], POLLIN, 0},
        {stderr_pipe[0], POLLIN, 0},
    };
    std::string* sinks[2] = {&result.stdout_str, &result.stderr_str};
    int open_fds = 2;

    const bool bounded = opts.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + opts.timeout;

    char buf[4096];
    while (open_fds > 0) {
        int wait_ms = -1;
        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                LOGW("%s timed out after %lld ms, killing", args[0].c_str(),
                     static_cast<long long>(opts.timeout.count()));
                kill(-pid, SIGKILL);
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        int rc = poll(fds, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            LOGE("poll: %s", strerror(errno));
            break;
        }

        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, n);
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }

    for (auto& pfd : fds) {
        if (pfd.fd >= 0)
            close(pfd.fd);
    }

    // The child may close its output and keep running, the deadline still holds
    int status = 0;
    while (bounded && !result.timed_out) {
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            if (WIFEXITED(status))
                result.exit_code = WEXITSTATUS(status);
            return result;
        }
        if (rc < 0 && errno != EINTR) {
            LOGE("waitpid: %s", strerror(errno));
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            LOGW("%s timed out after %lld ms, killing", args[0].c_str(),
                 static_cast<long long>(opts.timeout.count()));
            kill(-pid, SIGKILL);
            result.timed_out = true;
            break;
        }
        usleep(10 * 1000);
    }

    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            LOGE("waitpid: %s", strerror(errno));
            return result;
        }
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }

    return result;
}

}  // namespace roverctl
