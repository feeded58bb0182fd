#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "conf/rover_config.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"

namespace roverctl {
namespace {

using json = nlohmann::json;
using test::TempDir;

TEST(RoverConfigTest, DefaultsMatchRoverLiterals) {
    auto cfg = RoverConfig::defaults();
    EXPECT_TRUE(cfg.auto_study_enabled);
    EXPECT_EQ(cfg.study_interval, 30);
    EXPECT_EQ(cfg.default_speed, 50);
    EXPECT_TRUE(cfg.ir_priority);
    EXPECT_TRUE(cfg.log_to_file);
    EXPECT_EQ(cfg.camera_resolution.width, 320);
    EXPECT_EQ(cfg.camera_resolution.height, 240);
    EXPECT_EQ(cfg.min_obstacle_area, 1500);
    EXPECT_TRUE(cfg.validate().empty());
}

TEST(RoverConfigTest, SerializesInFileOrder) {
    EXPECT_EQ(RoverConfig::defaults().to_json().dump(),
              R"({"auto_study_enabled":true,"study_interval":30,"default_speed":50,)"
              R"("ir_priority":true,"log_to_file":true,"camera_resolution":[320,240],)"
              R"("min_obstacle_area":1500})");
}

TEST(RoverConfigTest, FileValuesOverrideDefaults) {
    auto cfg = RoverConfig::from_json(json::parse(R"({"default_speed": 70, "ir_priority": false})"));
    EXPECT_EQ(cfg.default_speed, 70);
    EXPECT_FALSE(cfg.ir_priority);
    EXPECT_EQ(cfg.study_interval, 30);
    EXPECT_EQ(cfg.camera_resolution.width, 320);
}

TEST(RoverConfigTest, UnknownKeysSurviveRewrite) {
    auto cfg = RoverConfig::from_json(json::parse(R"({"motor_trim": 3, "study_interval": 10})"));
    EXPECT_EQ(cfg.extra["motor_trim"], 3);

    auto out = cfg.to_json();
    EXPECT_EQ(out["motor_trim"], 3);
    EXPECT_EQ(out["study_interval"], 10);
    EXPECT_EQ(out.begin().key(), "auto_study_enabled");
}

TEST(RoverConfigTest, RejectsWrongTypes) {
    EXPECT_THROW(RoverConfig::from_json(json::parse(R"({"default_speed": "fast"})")), ConfigError);
    EXPECT_THROW(RoverConfig::from_json(json::parse(R"({"log_to_file": 1})")), ConfigError);
    EXPECT_THROW(RoverConfig::from_json(json::parse(R"({"camera_resolution": [320]})")),
                 ConfigError);
    EXPECT_THROW(RoverConfig::from_json(json::parse("[]")), ConfigError);
}

TEST(RoverConfigTest, MissingFileYieldsDefaults) {
    TempDir tmp;
    EXPECT_TRUE(RoverConfig::load(tmp.file("rover_config.json")) == RoverConfig::defaults());
}

TEST(RoverConfigTest, InvalidFileThrows) {
    TempDir tmp;
    ASSERT_TRUE(write_file(tmp.file("rover_config.json"), "{\"default_speed\": "));
    EXPECT_THROW(RoverConfig::load(tmp.file("rover_config.json")), ConfigError);
}

TEST(RoverConfigTest, SaveThenLoad) {
    TempDir tmp;
    std::string path = tmp.file("rover_config.json");

    auto cfg = RoverConfig::defaults();
    cfg.default_speed = 65;
    cfg.camera_resolution = {640, 480};
    ASSERT_TRUE(cfg.save(path));

    std::string text = read_file(path).value_or("");
    EXPECT_TRUE(ends_with(text, "}\n"));
    EXPECT_NE(text.find("\n  \"default_speed\": 65"), std::string::npos);
    EXPECT_TRUE(RoverConfig::load(path) == cfg);
}

TEST(RoverConfigTest, ValidateFlagsUnusableValues) {
    auto cfg = RoverConfig::defaults();
    cfg.default_speed = 150;
    cfg.study_interval = 0;
    cfg.camera_resolution = {0, 240};
    EXPECT_EQ(cfg.validate().size(), 3u);
}

}  // namespace
}  // namespace roverctl
