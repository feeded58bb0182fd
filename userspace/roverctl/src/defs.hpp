#pragma once

#include <cstdint>
#include <string>

namespace roverctl {

// Version info
extern const char* VERSION_CODE;
extern const char* VERSION_NAME;

// Rover project layout, relative to the target user's home
constexpr const char* PROJECT_DIR = "~/rover_project";
constexpr const char* DATA_DIR = "~/rover_project/data";
constexpr const char* DATA_LOG_DIR = "~/rover_project/data/logs";
constexpr const char* DATA_IMAGE_DIR = "~/rover_project/data/images";
constexpr const char* ROVER_CONFIG_PATH = "~/rover_project/rover_config.json";

// Data log produced by the rover and mirrored by `sync`
constexpr const char* DATA_LOG_NAME = "rover_data_log.json";

// Sync defaults
constexpr const char* SYNC_REMOTE = "pi@raspberrypi.local:~/rover_project/rover_data_log.json";
constexpr const char* SYNC_DEST = ".";
constexpr const char* SCP_PATH = "scp";
constexpr unsigned SYNC_INTERVAL_SEC = 5;
constexpr unsigned SYNC_TIMEOUT_SEC = 30;
constexpr unsigned SYNC_CONNECT_TIMEOUT_SEC = 10;
constexpr unsigned SYNC_WARN_AFTER_FAILURES = 3;
constexpr const char* PART_SUFFIX = ".part";

// Provisioning
constexpr const char* PIP_REQUIREMENTS = "requirements_rpi.txt";
constexpr const char* I2C_BUS = "1";
constexpr const char* BACKUP_SUFFIX = ".bak";

// Rover config defaults
constexpr bool DEFAULT_AUTO_STUDY_ENABLED = true;
constexpr int64_t DEFAULT_STUDY_INTERVAL = 30;
constexpr int64_t DEFAULT_SPEED = 50;
constexpr bool DEFAULT_IR_PRIORITY = true;
constexpr bool DEFAULT_LOG_TO_FILE = true;
constexpr int64_t DEFAULT_CAMERA_WIDTH = 320;
constexpr int64_t DEFAULT_CAMERA_HEIGHT = 240;
constexpr int64_t DEFAULT_MIN_OBSTACLE_AREA = 1500;

}  // namespace roverctl
