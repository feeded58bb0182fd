// provision/converge.cpp - Bring a host to the manifest's state
#include "converge.hpp"
#include "../log.hpp"

#include <algorithm>
#include <utility>

namespace roverctl {

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
    case Outcome::Ok:
        return "ok";
    case Outcome::Changed:
        return "changed";
    case Outcome::Pending:
        return "pending";
    case Outcome::Failed:
        return "failed";
    case Outcome::Skipped:
        return "skipped";
    case Outcome::Warning:
        return "warning";
    }
    return "unknown";
}

size_t Report::count(Outcome outcome) const {
    return static_cast<size_t>(std::count_if(items.begin(), items.end(),
                                             [&](const ResourceReport& r) {
                                                 return r.outcome == outcome;
                                             }));
}

bool Report::ok() const {
    return count(Outcome::Failed) == 0 && count(Outcome::Skipped) == 0;
}

static ResourceReport run_probe(Resource& res, Host& host) {
    ResourceReport item{res.name(), res.kind(), Outcome::Ok, "done"};
    std::string error;
    if (!res.apply(host, error)) {
        item.outcome = res.critical() ? Outcome::Failed : Outcome::Warning;
        item.detail = error;
        LOGW("%s: %s", res.name().c_str(), error.c_str());
    }
    return item;
}

static ResourceReport converge_one(Resource& res, Host& host, const ConvergeOptions& opts) {
    ResourceReport item{res.name(), res.kind(), Outcome::Ok, ""};

    auto before = res.check(host);
    if (before.converged) {
        item.detail = before.detail;
        return item;
    }

    if (opts.dry_run) {
        item.outcome = Outcome::Pending;
        item.detail = before.detail;
        return item;
    }

    LOGI("Applying %s (%s)", res.name().c_str(), before.detail.c_str());
    std::string error;
    if (!res.apply(host, error)) {
        item.outcome = Outcome::Failed;
        item.detail = error.empty() ? "apply failed" : error;
        LOGE("%s: %s", res.name().c_str(), item.detail.c_str());
        return item;
    }

    auto after = res.check(host);
    if (!after.converged) {
        item.outcome = Outcome::Failed;
        item.detail = "still not converged: " + after.detail;
        LOGE("%s: %s", res.name().c_str(), item.detail.c_str());
        return item;
    }

    item.outcome = Outcome::Changed;
    item.detail = after.detail;
    return item;
}

Report converge(const Manifest& manifest, Host& host, const ConvergeOptions& opts,
                const ProgressCallback& progress) {
    Report report;
    bool stopped = false;

    for (const auto& res : manifest.resources()) {
        ResourceReport item;
        if (stopped) {
            item = {res->name(), res->kind(), Outcome::Skipped, "not attempted"};
        } else if (res->observe_only()) {
            item = run_probe(*res, host);
        } else {
            item = converge_one(*res, host, opts);
        }

        if (item.outcome == Outcome::Failed && res->critical() && !opts.keep_going) {
            LOGE("Stopping after critical failure of %s", res->name().c_str());
            stopped = true;
        }

        if (progress)
            progress(item);
        report.items.push_back(std::move(item));
    }

    LOGD("converge: %zu ok, %zu changed, %zu pending, %zu failed, %zu skipped",
         report.count(Outcome::Ok), report.count(Outcome::Changed),
         report.count(Outcome::Pending), report.count(Outcome::Failed),
         report.count(Outcome::Skipped));
    return report;
}

}  // namespace roverctl
