#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "conf/rover_config.hpp"
#include "provision/manifest.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

namespace roverctl {
namespace {

using ordered_json = nlohmann::ordered_json;

std::vector<std::string> kinds(const Manifest& m) {
    std::vector<std::string> out;
    for (const auto& r : m.resources()) {
        out.push_back(r->kind());
    }
    return out;
}

std::string error_of(const char* text) {
    try {
        Manifest::from_json(ordered_json::parse(text));
    } catch (const ManifestError& e) {
        return e.what();
    }
    return "";
}

TEST(ManifestTest, RoverDefaultFollowsSetupOrder) {
    auto m = Manifest::rover_default();
    EXPECT_EQ(kinds(m), (std::vector<std::string>{"apt_index", "apt_upgrade", "apt_packages",
                                                  "pip_requirements", "i2c", "groups",
                                                  "directory", "directory", "directory",
                                                  "json_file", "probe"}));

    auto doc = m.to_json();
    const auto& list = doc["resources"];
    EXPECT_EQ(list[2]["packages"],
              ordered_json({"python3-pip", "python3-dev", "python3-opencv", "libgpiod2",
                            "python3-pil", "i2c-tools", "python3-smbus", "libatlas-base-dev",
                            "git"}));
    EXPECT_EQ(list[3]["file"], "requirements_rpi.txt");
    EXPECT_EQ(list[5]["groups"], ordered_json({"gpio", "i2c", "spi", "video"}));
    EXPECT_EQ(list[6]["path"], "~/rover_project/data");
    EXPECT_EQ(list[7]["path"], "~/rover_project/data/logs");
    EXPECT_EQ(list[8]["path"], "~/rover_project/data/images");
    EXPECT_EQ(list[9]["path"], "~/rover_project/rover_config.json");
    EXPECT_EQ(list[9]["content"], RoverConfig::defaults().to_json());
    EXPECT_EQ(list[10]["command"], ordered_json({"i2cdetect", "-y", "1"}));
    EXPECT_FALSE(list[10]["critical"].get<bool>());
}

TEST(ManifestTest, DumpedManifestLoadsBack) {
    auto doc = Manifest::rover_default().to_json();
    auto reloaded = Manifest::from_json(doc);
    EXPECT_EQ(reloaded.to_json(), doc);
}

TEST(ManifestTest, CustomEntries) {
    auto m = Manifest::from_json(ordered_json::parse(R"({"resources": [
        {"kind": "directory", "path": "/srv/rover", "mode": "0750", "name": "rover data"},
        {"kind": "json_file", "path": "~/cfg.json", "content": {"a": 1}, "on_conflict": "keep"},
        {"kind": "probe", "command": ["uname", "-a"], "critical": true},
        {"kind": "apt_index", "max_age": 60}
    ]})"));

    ASSERT_EQ(m.resources().size(), 4u);
    EXPECT_EQ(m.resources()[0]->name(), "rover data");
    EXPECT_EQ(m.resources()[0]->to_json()["mode"], "0750");
    EXPECT_EQ(m.resources()[1]->to_json()["on_conflict"], "keep");
    EXPECT_TRUE(m.resources()[2]->critical());
    EXPECT_EQ(m.resources()[3]->to_json()["max_age"], 60);
}

TEST(ManifestTest, ErrorsNameTheEntry) {
    EXPECT_NE(error_of(R"({"resources": [{"kind": "directory", "path": "/a"}, {"kind": "firmware"}]})")
                  .find("resource 1 (firmware): unknown kind"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"resources": [{"kind": "apt_packages", "packages": []}]})")
                  .find("resource 0 (apt_packages)"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"resources": [{"kind": "groups"}]})").find("'groups'"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"resources": [{"kind": "directory"}]})").find("missing 'path'"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"resources": [{"kind": "directory", "path": "/a", "mode": "rwx"}]})")
                  .find("'mode'"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"resources": [{"kind": "json_file", "path": "/a", "content": {},
                                          "on_conflict": "merge"}]})")
                  .find("on_conflict"),
              std::string::npos);
    EXPECT_NE(error_of(R"({"resources": [{"path": "/a"}]})").find("'kind'"), std::string::npos);
    EXPECT_FALSE(error_of(R"({"resources": {}})").empty());
    EXPECT_FALSE(error_of("[]").empty());
}

TEST(ManifestTest, LoadFromFile) {
    test::TempDir tmp;
    std::string path = tmp.file("manifest.json");

    ASSERT_TRUE(write_file(path, R"({"resources": [{"kind": "i2c"}]})"));
    EXPECT_EQ(kinds(Manifest::load(path)), (std::vector<std::string>{"i2c"}));

    ASSERT_TRUE(write_file(path, "{\"resources\": ["));
    EXPECT_THROW(Manifest::load(path), ManifestError);
    EXPECT_THROW(Manifest::load(tmp.file("absent.json")), ManifestError);
}

}  // namespace
}  // namespace roverctl
