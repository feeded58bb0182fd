// provision/resource.hpp - Desired-state resources
#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "host.hpp"

namespace roverctl {

struct CheckResult {
    bool converged;
    std::string detail;
};

class Resource {
public:
    Resource(std::string name, bool critical) : name_(std::move(name)), critical_(critical) {}
    virtual ~Resource() = default;

    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }
    bool critical() const { return critical_; }

    virtual const char* kind() const = 0;
    // Must not change the host
    virtual CheckResult check(Host& host) = 0;
    // Sets `error` on failure
    virtual bool apply(Host& host, std::string& error) = 0;
    virtual nlohmann::ordered_json to_json() const = 0;

    // Read-only diagnostics run even in dry-run mode and are never re-checked
    virtual bool observe_only() const { return false; }

protected:
    nlohmann::ordered_json base_json() const;

private:
    std::string name_;
    bool critical_;
};

// Package index no older than max_age
class AptIndex : public Resource {
public:
    explicit AptIndex(std::chrono::seconds max_age, bool critical = true);
    const char* kind() const override { return "apt_index"; }
    CheckResult check(Host& host) override;
    bool apply(Host& host, std::string& error) override;
    nlohmann::ordered_json to_json() const override;

private:
    std::chrono::seconds max_age_;
};

// No pending upgrades
class AptUpgrade : public Resource {
public:
    explicit AptUpgrade(bool critical = true);
    const char* kind() const override { return "apt_upgrade"; }
    CheckResult check(Host& host) override;
    bool apply(Host& host, std::string& error) override;
    nlohmann::ordered_json to_json() const override;
};

class AptPackages : public Resource {
public:
    explicit AptPackages(std::vector<std::string> packages, bool critical = true);
    const char* kind() const override { return "apt_packages"; }
    CheckResult check(Host& host) override;
    bool apply(Host& host, std::string& error) override;
    nlohmann::ordered_json to_json() const override;

    std::vector<std::string> missing(Host& host) const;

private:
    std::vector<std::string> packages_;
};

class PipRequirements : public Resource {
public:
    PipRequirements(std::string file, std::string pip, bool critical = true);
    const char* kind() const override { return "pip_requirements"; }
    CheckResult check(Host& host) override;
    bool apply(Host& host, std::string& error) override;
    nlohmann::ordered_json to_json() const override;

    // Distribution names listed in a requirements file
    static std::vector<std::string> parse_requirements(const std::string& text);

private:
    std::string file_;
    std::string pip_;
};

// I2C enabled through raspi-config
class I2cInterface : public Resource {
public:
    explicit I2cInterface(bool critical = true);
    const char* kind() const override { return "i2c"; }
    CheckResult check(Host& host) override;
    bool apply(Host& host, std::string& error) override;
    nlohmann::ordered_json to_json() const override;
};

// Target user belongs to every group
class GroupMembership : public Resource {
public:
    explicit GroupMembership(std::vector<std::string> groups, bool critical = true);
    const char* kind() const override { return "groups"; }
    CheckResult check(Host& host) override;
    bool apply(Host& host, std::string& error) override;
    nlohmann::ordered_json to_json() const override;

    std::vector<std::string> missing(Host& host) const;

private:
    std::vector<std::string> groups_;
};

class Directory : public Resource {
public:
    Directory(std::string path, mode_t mode = 0755, bool critical = true);
    const char* kind() const override { return "directory"; }
    CheckResult check(Host& host) override;
    bool apply(Host& host, std::string& error) override;
    nlohmann::ordered_json to_json() const override;

private:
    std::string path_;
    mode_t mode_;
};

// File whose parsed content must equal `content`
class JsonFile : public Resource {
public:
    enum class OnConflict { Replace, Keep };

    JsonFile(std::string path, nlohmann::ordered_json content,
             OnConflict on_conflict = OnConflict::Replace, mode_t mode = 0644,
             bool critical = true);
    const char* kind() const override { return "json_file"; }
    CheckResult check(Host& host) override;
    bool apply(Host& host, std::string& error) override;
    nlohmann::ordered_json to_json() const override;

private:
    std::string path_;
    nlohmann::ordered_json content_;
    OnConflict on_conflict_;
    mode_t mode_;
};

// Diagnostic command, output goes to the log
class Probe : public Resource {
public:
    explicit Probe(std::vector<std::string> command, bool critical = false);
    const char* kind() const override { return "probe"; }
    CheckResult check(Host& host) override;
    bool apply(Host& host, std::string& error) override;
    nlohmann::ordered_json to_json() const override;
    bool observe_only() const override { return true; }

private:
    std::vector<std::string> command_;
};

}  // namespace roverctl
