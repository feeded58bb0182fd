// provision/converge.hpp - Bring a host to the manifest's state
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "host.hpp"
#include "manifest.hpp"

namespace roverctl {

enum class Outcome {
    Ok,       // already converged
    Changed,  // applied and now converged
    Pending,  // would change (dry run)
    Failed,
    Skipped,  // not attempted after a critical failure
    Warning,  // non-critical failure
};

const char* outcome_name(Outcome outcome);

struct ResourceReport {
    std::string name;
    std::string kind;
    Outcome outcome;
    std::string detail;
};

struct ConvergeOptions {
    bool dry_run = false;
    bool keep_going = false;
};

struct Report {
    std::vector<ResourceReport> items;

    size_t count(Outcome outcome) const;
    // Nothing failed or was skipped
    bool ok() const;
};

using ProgressCallback = std::function<void(const ResourceReport&)>;

Report converge(const Manifest& manifest, Host& host, const ConvergeOptions& opts,
                const ProgressCallback& progress = nullptr);

}  // namespace roverctl
