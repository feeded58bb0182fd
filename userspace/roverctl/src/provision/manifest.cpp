// provision/manifest.cpp - Declarative host description
#include "manifest.hpp"
#include "../conf/rover_config.hpp"
#include "../defs.hpp"
#include "../log.hpp"
#include "../utils.hpp"

#include <sys/types.h>
#include <chrono>
#include <memory>

using ordered_json = nlohmann::ordered_json;

namespace roverctl {

namespace {

constexpr int64_t DEFAULT_INDEX_MAX_AGE = 3600;

// Field accessors raising ManifestError that names the entry
class Entry {
public:
    Entry(const ordered_json& obj, size_t index) : obj_(obj), index_(index) {
        if (!obj_.is_object())
            fail("must be an object");
        auto it = obj_.find("kind");
        if (it == obj_.end() || !it->is_string())
            fail("needs a string 'kind'");
        kind_ = it->get<std::string>();
    }

    const std::string& kind() const { return kind_; }

    [[noreturn]] void fail(const std::string& what) const {
        std::string where = "resource " + std::to_string(index_);
        if (!kind_.empty())
            where += " (" + kind_ + ")";
        throw ManifestError(where + ": " + what);
    }

    std::string string(const char* key, const char* fallback = nullptr) const {
        auto it = obj_.find(key);
        if (it == obj_.end()) {
            if (!fallback)
                fail(std::string("missing '") + key + "'");
            return fallback;
        }
        if (!it->is_string() || it->get<std::string>().empty())
            fail(std::string("'") + key + "' must be a non-empty string");
        return it->get<std::string>();
    }

    bool boolean(const char* key, bool fallback) const {
        auto it = obj_.find(key);
        if (it == obj_.end())
            return fallback;
        if (!it->is_boolean())
            fail(std::string("'") + key + "' must be a boolean");
        return it->get<bool>();
    }

    int64_t integer(const char* key, int64_t fallback) const {
        auto it = obj_.find(key);
        if (it == obj_.end())
            return fallback;
        if (!it->is_number_integer() || it->get<int64_t>() < 0)
            fail(std::string("'") + key + "' must be a non-negative integer");
        return it->get<int64_t>();
    }

    std::vector<std::string> strings(const char* key) const {
        auto it = obj_.find(key);
        if (it == obj_.end() || !it->is_array() || it->empty())
            fail(std::string("'") + key + "' must be a non-empty array of strings");
        std::vector<std::string> out;
        for (const auto& v : *it) {
            if (!v.is_string() || v.get<std::string>().empty())
                fail(std::string("'") + key + "' must be a non-empty array of strings");
            out.push_back(v.get<std::string>());
        }
        return out;
    }

    mode_t mode(const char* fallback) const {
        std::string text = string("mode", fallback);
        try {
            size_t used = 0;
            unsigned long v = std::stoul(text, &used, 8);
            if (used == text.size() && v <= 07777)
                return static_cast<mode_t>(v);
        } catch (const std::exception&) {
        }
        fail("'mode' must be an octal string such as \"0755\"");
    }

    const ordered_json& object(const char* key) const {
        auto it = obj_.find(key);
        if (it == obj_.end() || !it->is_object())
            fail(std::string("'") + key + "' must be an object");
        return *it;
    }

private:
    const ordered_json& obj_;
    size_t index_;
    std::string kind_;
};

std::unique_ptr<Resource> build_resource(const Entry& e) {
    const std::string& kind = e.kind();
    std::unique_ptr<Resource> res;

    if (kind == "apt_index") {
        res = std::make_unique<AptIndex>(
            std::chrono::seconds(e.integer("max_age", DEFAULT_INDEX_MAX_AGE)),
            e.boolean("critical", true));
    } else if (kind == "apt_upgrade") {
        res = std::make_unique<AptUpgrade>(e.boolean("critical", true));
    } else if (kind == "apt_packages") {
        res = std::make_unique<AptPackages>(e.strings("packages"), e.boolean("critical", true));
    } else if (kind == "pip_requirements") {
        res = std::make_unique<PipRequirements>(e.string("file", PIP_REQUIREMENTS),
                                                e.string("pip", "pip3"),
                                                e.boolean("critical", true));
    } else if (kind == "i2c") {
        res = std::make_unique<I2cInterface>(e.boolean("critical", true));
    } else if (kind == "groups") {
        res = std::make_unique<GroupMembership>(e.strings("groups"), e.boolean("critical", true));
    } else if (kind == "directory") {
        res = std::make_unique<Directory>(e.string("path"), e.mode("0755"),
                                          e.boolean("critical", true));
    } else if (kind == "json_file") {
        std::string policy = e.string("on_conflict", "replace");
        JsonFile::OnConflict on_conflict;
        if (policy == "replace") {
            on_conflict = JsonFile::OnConflict::Replace;
        } else if (policy == "keep") {
            on_conflict = JsonFile::OnConflict::Keep;
        } else {
            e.fail("'on_conflict' must be \"replace\" or \"keep\"");
        }
        res = std::make_unique<JsonFile>(e.string("path"), e.object("content"), on_conflict,
                                         e.mode("0644"), e.boolean("critical", true));
    } else if (kind == "probe") {
        res = std::make_unique<Probe>(e.strings("command"), e.boolean("critical", false));
    } else {
        e.fail("unknown kind");
    }

    return res;
}

}  // namespace

Manifest Manifest::from_json(const ordered_json& doc) {
    if (!doc.is_object())
        throw ManifestError("manifest must be a JSON object");
    auto list = doc.find("resources");
    if (list == doc.end() || !list->is_array())
        throw ManifestError("manifest needs a 'resources' array");

    Manifest manifest;
    for (size_t i = 0; i < list->size(); i++) {
        Entry entry((*list)[i], i);
        auto res = build_resource(entry);
        auto name = (*list)[i].find("name");
        if (name != (*list)[i].end()) {
            if (!name->is_string())
                entry.fail("'name' must be a string");
            res->set_name(name->get<std::string>());
        }
        manifest.add(std::move(res));
    }
    return manifest;
}

Manifest Manifest::load(const std::string& path) {
    auto content = read_file(path);
    if (!content)
        throw ManifestError("cannot read " + path);

    ordered_json doc = ordered_json::parse(*content, nullptr, false);
    if (doc.is_discarded())
        throw ManifestError(path + " is not valid JSON");

    LOGD("Loading manifest %s", path.c_str());
    return from_json(doc);
}

Manifest Manifest::rover_default() {
    Manifest m;
    m.add(std::make_unique<AptIndex>(std::chrono::seconds(DEFAULT_INDEX_MAX_AGE)));
    m.add(std::make_unique<AptUpgrade>());
    m.add(std::make_unique<AptPackages>(std::vector<std::string>{
        "python3-pip", "python3-dev", "python3-opencv", "libgpiod2", "python3-pil", "i2c-tools",
        "python3-smbus", "libatlas-base-dev", "git"}));
    m.add(std::make_unique<PipRequirements>(PIP_REQUIREMENTS, "pip3"));
    m.add(std::make_unique<I2cInterface>());
    m.add(std::make_unique<GroupMembership>(
        std::vector<std::string>{"gpio", "i2c", "spi", "video"}));
    m.add(std::make_unique<Directory>(DATA_DIR));
    m.add(std::make_unique<Directory>(DATA_LOG_DIR));
    m.add(std::make_unique<Directory>(DATA_IMAGE_DIR));
    m.add(std::make_unique<JsonFile>(ROVER_CONFIG_PATH, RoverConfig::defaults().to_json()));
    m.add(std::make_unique<Probe>(std::vector<std::string>{"i2cdetect", "-y", I2C_BUS}));
    return m;
}

ordered_json Manifest::to_json() const {
    ordered_json list = ordered_json::array();
    for (const auto& res : resources_) {
        list.push_back(res->to_json());
    }
    ordered_json doc;
    doc["resources"] = list;
    return doc;
}

void Manifest::add(std::unique_ptr<Resource> resource) {
    resources_.push_back(std::move(resource));
}

}  // namespace roverctl
