// provision/resource.cpp - Desired-state resources
#include "resource.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <set>
#include <sstream>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace roverctl {

static std::string failure_reason(const ExecResult& r, const std::string& what) {
    if (r.timed_out)
        return what + " timed out";
    if (r.exit_code == 127)
        return what + " is not installed";

    for (const auto& line : split(r.stderr_str, '\n')) {
        std::string t = trim(line);
        if (!t.empty())
            return what + ": " + t;
    }
    return what + " exited with " + std::to_string(r.exit_code);
}

static std::vector<std::string> split_ws(const std::string& text) {
    std::istringstream iss(text);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w) {
        words.push_back(w);
    }
    return words;
}

// pip installs into the target user, not root
static std::vector<std::string> as_user(const Host& host, std::vector<std::string> args) {
    if (geteuid() != 0 || host.user.uid == 0)
        return args;
    std::vector<std::string> wrapped = {"runuser", "-u", host.user.name, "--"};
    wrapped.insert(wrapped.end(), args.begin(), args.end());
    return wrapped;
}

ordered_json Resource::base_json() const {
    ordered_json j;
    j["kind"] = kind();
    j["name"] = name_;
    j["critical"] = critical_;
    return j;
}

// --- apt_index ---

AptIndex::AptIndex(std::chrono::seconds max_age, bool critical)
    : Resource("package index", critical), max_age_(max_age) {}

CheckResult AptIndex::check(Host& host) {
    std::string lists = host.path("/var/lib/apt/lists");
    DIR* dir = opendir(lists.c_str());
    if (!dir)
        return {false, "no package lists in " + lists};

    time_t newest = 0;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (entry->d_name[0] == '.' || strcmp(entry->d_name, "lock") == 0)
            continue;
        struct stat st;
        std::string file = lists + "/" + entry->d_name;
        if (stat(file.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
            newest = std::max(newest, st.st_mtime);
        }
    }
    closedir(dir);

    if (newest == 0)
        return {false, "package index has never been refreshed"};

    long long age = static_cast<long long>(time(nullptr) - newest);
    if (age <= max_age_.count())
        return {true, "refreshed " + std::to_string(age) + "s ago"};
    return {false, "last refreshed " + std::to_string(age) + "s ago"};
}

bool AptIndex::apply(Host& host, std::string& error) {
    auto r = host.runner.run({"apt-get", "update"});
    if (r.exit_code != 0) {
        error = failure_reason(r, "apt-get update");
        return false;
    }
    return true;
}

ordered_json AptIndex::to_json() const {
    ordered_json j = base_json();
    j["max_age"] = max_age_.count();
    return j;
}

// --- apt_upgrade ---

AptUpgrade::AptUpgrade(bool critical) : Resource("system upgrade", critical) {}

CheckResult AptUpgrade::check(Host& host) {
    auto r = host.runner.run({"apt-get", "-s", "upgrade"});
    if (r.exit_code != 0)
        return {false, failure_reason(r, "apt-get -s upgrade")};

    size_t pending = 0;
    for (const auto& line : split(r.stdout_str, '\n')) {
        if (starts_with(line, "Inst "))
            pending++;
    }
    if (pending == 0)
        return {true, "no pending upgrades"};
    return {false, std::to_string(pending) + " package(s) upgradable"};
}

bool AptUpgrade::apply(Host& host, std::string& error) {
    auto r = host.runner.run({"env", "DEBIAN_FRONTEND=noninteractive", "apt-get", "upgrade", "-y"});
    if (r.exit_code != 0) {
        error = failure_reason(r, "apt-get upgrade");
        return false;
    }
    return true;
}

ordered_json AptUpgrade::to_json() const {
    return base_json();
}

// --- apt_packages ---

AptPackages::AptPackages(std::vector<std::string> packages, bool critical)
    : Resource("packages: " + join(packages, " "), critical), packages_(std::move(packages)) {}

std::vector<std::string> AptPackages::missing(Host& host) const {
    std::vector<std::string> out;
    for (const auto& pkg : packages_) {
        auto r = host.runner.run({"dpkg-query", "-W", "-f=${Status}", pkg});
        if (r.exit_code != 0 || r.stdout_str.find("install ok installed") == std::string::npos) {
            out.push_back(pkg);
        }
    }
    return out;
}

CheckResult AptPackages::check(Host& host) {
    auto absent = missing(host);
    if (absent.empty())
        return {true, std::to_string(packages_.size()) + " package(s) installed"};
    return {false, "missing: " + join(absent, " ")};
}

bool AptPackages::apply(Host& host, std::string& error) {
    auto absent = missing(host);
    if (absent.empty())
        return true;

    std::vector<std::string> args = {"env", "DEBIAN_FRONTEND=noninteractive", "apt-get",
                                     "install", "-y"};
    args.insert(args.end(), absent.begin(), absent.end());

    auto r = host.runner.run(args);
    if (r.exit_code != 0) {
        error = failure_reason(r, "apt-get install");
        return false;
    }
    return true;
}

ordered_json AptPackages::to_json() const {
    ordered_json j = base_json();
    j["packages"] = packages_;
    return j;
}

// --- pip_requirements ---

PipRequirements::PipRequirements(std::string file, std::string pip, bool critical)
    : Resource("pip requirements " + file, critical),
      file_(std::move(file)),
      pip_(std::move(pip)) {}

std::vector<std::string> PipRequirements::parse_requirements(const std::string& text) {
    std::vector<std::string> names;
    for (auto line : split(text, '\n')) {
        size_t hash = line.find('#');
        if (hash != std::string::npos)
            line = line.substr(0, hash);
        line = trim(line);
        // Options (-r, -e, --index-url) and direct URLs are left to pip
        if (line.empty() || line[0] == '-' || line.find("://") != std::string::npos)
            continue;

        size_t end = line.find_first_of("<>=!~;[ @\t");
        std::string name = line.substr(0, end);
        if (!name.empty())
            names.push_back(name);
    }
    return names;
}

CheckResult PipRequirements::check(Host& host) {
    std::string path = host.path(file_);
    auto content = read_file(path);
    if (!content)
        return {false, "requirements file " + path + " not found"};

    std::vector<std::string> absent;
    for (const auto& name : parse_requirements(*content)) {
        auto r = host.runner.run(as_user(host, {pip_, "show", "-q", name}));
        if (r.exit_code != 0)
            absent.push_back(name);
    }
    if (absent.empty())
        return {true, "all requirements installed"};
    return {false, "missing: " + join(absent, " ")};
}

bool PipRequirements::apply(Host& host, std::string& error) {
    std::string path = host.path(file_);
    if (!is_regular_file(path)) {
        error = "requirements file " + path + " not found";
        return false;
    }

    auto r = host.runner.run(as_user(host, {pip_, "install", "-r", path}));
    if (r.exit_code != 0) {
        error = failure_reason(r, pip_ + " install");
        return false;
    }
    return true;
}

ordered_json PipRequirements::to_json() const {
    ordered_json j = base_json();
    j["file"] = file_;
    j["pip"] = pip_;
    return j;
}

// --- i2c ---

I2cInterface::I2cInterface(bool critical) : Resource("I2C interface", critical) {}

CheckResult I2cInterface::check(Host& host) {
    auto r = host.runner.run({"raspi-config", "nonint", "get_i2c"});
    if (r.exit_code != 0)
        return {false, failure_reason(r, "raspi-config")};
    // raspi-config answers 0 for enabled
    if (trim(r.stdout_str) == "0")
        return {true, "enabled"};
    return {false, "disabled"};
}

bool I2cInterface::apply(Host& host, std::string& error) {
    auto r = host.runner.run({"raspi-config", "nonint", "do_i2c", "0"});
    if (r.exit_code != 0) {
        error = failure_reason(r, "raspi-config");
        return false;
    }
    return true;
}

ordered_json I2cInterface::to_json() const {
    return base_json();
}

// --- groups ---

GroupMembership::GroupMembership(std::vector<std::string> groups, bool critical)
    : Resource("groups: " + join(groups, ","), critical), groups_(std::move(groups)) {}

std::vector<std::string> GroupMembership::missing(Host& host) const {
    auto r = host.runner.run({"id", "-nG", host.user.name});
    std::set<std::string> current;
    if (r.exit_code == 0) {
        for (const auto& g : split_ws(r.stdout_str)) {
            current.insert(g);
        }
    } else {
        LOGW("%s", failure_reason(r, "id").c_str());
    }

    std::vector<std::string> out;
    for (const auto& g : groups_) {
        if (!current.count(g))
            out.push_back(g);
    }
    return out;
}

CheckResult GroupMembership::check(Host& host) {
    auto absent = missing(host);
    if (absent.empty())
        return {true, host.user.name + " is in " + join(groups_, ",")};
    return {false, host.user.name + " is not in " + join(absent, ",")};
}

bool GroupMembership::apply(Host& host, std::string& error) {
    auto absent = missing(host);
    if (absent.empty())
        return true;

    for (const auto& g : absent) {
        auto r = host.runner.run({"getent", "group", g});
        if (r.exit_code != 0) {
            error = "group " + g + " does not exist";
            return false;
        }
    }

    auto r = host.runner.run({"usermod", "-a", "-G", join(absent, ","), host.user.name});
    if (r.exit_code != 0) {
        error = failure_reason(r, "usermod");
        return false;
    }
    LOGI("%s added to %s, effective after the next login", host.user.name.c_str(),
         join(absent, ",").c_str());
    return true;
}

ordered_json GroupMembership::to_json() const {
    ordered_json j = base_json();
    j["groups"] = groups_;
    return j;
}

// --- directory ---

Directory::Directory(std::string path, mode_t mode, bool critical)
    : Resource("directory " + path, critical), path_(std::move(path)), mode_(mode) {}

CheckResult Directory::check(Host& host) {
    std::string real = host.path(path_);
    if (is_directory(real))
        return {true, "exists"};
    struct stat st;
    if (lstat(real.c_str(), &st) == 0)
        return {false, real + " exists and is not a directory"};
    return {false, "missing"};
}

bool Directory::apply(Host& host, std::string& error) {
    std::string real = host.path(path_);

    // Remember which components get created so only those change owner
    std::vector<std::string> created;
    std::string current;
    for (const auto& part : split(real, '/')) {
        if (part.empty()) {
            if (current.empty())
                current = "/";
            continue;
        }
        if (!current.empty() && current.back() != '/')
            current += "/";
        current += part;
        if (!is_directory(current))
            created.push_back(current);
    }

    if (!ensure_dir_exists(real, mode_)) {
        error = "cannot create " + real;
        return false;
    }

    const std::string home = host.path(host.user.home);
    for (const auto& dir : created) {
        if (starts_with(dir, home))
            host.give_to_user(dir);
    }
    return true;
}

ordered_json Directory::to_json() const {
    ordered_json j = base_json();
    j["path"] = path_;
    char mode[8];
    snprintf(mode, sizeof(mode), "%04o", static_cast<unsigned>(mode_));
    j["mode"] = mode;
    return j;
}

// --- json_file ---

JsonFile::JsonFile(std::string path, ordered_json content, OnConflict on_conflict, mode_t mode,
                   bool critical)
    : Resource("file " + path, critical),
      path_(std::move(path)),
      content_(std::move(content)),
      on_conflict_(on_conflict),
      mode_(mode) {}

CheckResult JsonFile::check(Host& host) {
    std::string real = host.path(path_);
    if (!is_regular_file(real))
        return {false, "missing"};

    auto text = read_file(real);
    if (!text)
        return {false, "unreadable"};

    const bool keep = on_conflict_ == OnConflict::Keep;
    json current = json::parse(*text, nullptr, false);
    if (current.is_discarded())
        return {keep, keep ? "not valid JSON, keeping local file" : "not valid JSON"};

    // Compare as unordered objects so key order and whitespace do not matter
    if (current == json::parse(content_.dump()))
        return {true, "up to date"};
    return {keep, keep ? "differs, keeping local changes" : "content differs"};
}

bool JsonFile::apply(Host& host, std::string& error) {
    std::string real = host.path(path_);

    size_t slash = real.rfind('/');
    if (slash != std::string::npos && slash > 0) {
        std::string parent = real.substr(0, slash);
        if (!ensure_dir_exists(parent)) {
            error = "cannot create " + parent;
            return false;
        }
    }

    if (is_regular_file(real)) {
        auto old = read_file(real);
        if (!old || !write_file_atomic(real + BACKUP_SUFFIX, *old, mode_)) {
            error = "cannot back up " + real;
            return false;
        }
        LOGI("Saved previous %s as %s%s", real.c_str(), real.c_str(), BACKUP_SUFFIX);
    }

    if (!write_file_atomic(real, content_.dump(2) + "\n", mode_)) {
        error = "cannot write " + real;
        return false;
    }
    host.give_to_user(real);
    return true;
}

ordered_json JsonFile::to_json() const {
    ordered_json j = base_json();
    j["path"] = path_;
    j["content"] = content_;
    j["on_conflict"] = on_conflict_ == OnConflict::Keep ? "keep" : "replace";
    char mode[8];
    snprintf(mode, sizeof(mode), "%04o", static_cast<unsigned>(mode_));
    j["mode"] = mode;
    return j;
}

// --- probe ---

Probe::Probe(std::vector<std::string> command, bool critical)
    : Resource("probe: " + join(command, " "), critical), command_(std::move(command)) {}

CheckResult Probe::check(Host&) {
    return {false, "diagnostic"};
}

bool Probe::apply(Host& host, std::string& error) {
    auto r = host.runner.run(command_);
    for (const auto& line : split(r.stdout_str, '\n')) {
        if (!trim(line).empty())
            LOGI("%s", line.c_str());
    }
    if (r.exit_code != 0) {
        error = failure_reason(r, command_.empty() ? "probe" : command_[0]);
        return false;
    }
    return true;
}

ordered_json Probe::to_json() const {
    ordered_json j = base_json();
    j["command"] = command_;
    return j;
}

}  // namespace roverctl
