// provision/manifest.hpp - Declarative host description
#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "resource.hpp"

namespace roverctl {

class ManifestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Manifest {
public:
    // {"resources": [{"kind": "...", ...}, ...]}
    static Manifest from_json(const nlohmann::ordered_json& doc);
    static Manifest load(const std::string& path);

    // The rover host: packages, pip requirements, I2C, device groups,
    // data directories, rover_config.json and an I2C bus scan
    static Manifest rover_default();

    nlohmann::ordered_json to_json() const;

    void add(std::unique_ptr<Resource> resource);
    const std::vector<std::unique_ptr<Resource>>& resources() const { return resources_; }

private:
    std::vector<std::unique_ptr<Resource>> resources_;
};

}  // namespace roverctl
