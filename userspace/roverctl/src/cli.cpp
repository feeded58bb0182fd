#include "cli.hpp"
#include "conf/rover_config.hpp"
#include "datalog/datalog.hpp"
#include "defs.hpp"
#include "log.hpp"
#include "provision/provision_cli.hpp"
#include "sync/sync_cli.hpp"
#include "utils.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <vector>

namespace roverctl {

void CliParser::add_option(const CliOption& opt) {
    options_.push_back(opt);
}

const CliOption* CliParser::find_long(const std::string& name) const {
    for (const auto& opt : options_) {
        if (opt.long_name == name)
            return &opt;
    }
    return nullptr;
}

const CliOption* CliParser::find_short(char name) const {
    for (const auto& opt : options_) {
        if (opt.short_name != 0 && opt.short_name == name)
            return &opt;
    }
    return nullptr;
}

bool CliParser::parse(const std::vector<std::string>& args) {
    bool options_done = false;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];

        if (arg.empty())
            continue;

        if (options_done || arg[0] != '-' || arg == "-") {
            positional_args_.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        const CliOption* opt = nullptr;
        std::string opt_value;
        bool has_inline_value = false;

        // Long option
        if (arg[1] == '-') {
            std::string long_opt = arg.substr(2);
            size_t eq_pos = long_opt.find('=');
            if (eq_pos != std::string::npos) {
                opt_value = long_opt.substr(eq_pos + 1);
                long_opt = long_opt.substr(0, eq_pos);
                has_inline_value = true;
            }
            opt = find_long(long_opt);
        }
        // Short option
        else {
            opt = find_short(arg[1]);
            if (opt && arg.size() > 2) {
                opt_value = arg.substr(2);
                has_inline_value = true;
            }
        }

        if (!opt) {
            LOGE("Unknown option: %s", arg.c_str());
            return false;
        }

        if (opt->takes_value) {
            if (!has_inline_value) {
                if (i + 1 >= args.size()) {
                    LOGE("Option --%s needs a value", opt->long_name.c_str());
                    return false;
                }
                opt_value = args[++i];
            }
        } else if (has_inline_value) {
            LOGE("Option --%s takes no value", opt->long_name.c_str());
            return false;
        } else {
            opt_value = "true";
        }

        auto& values = parsed_options_[opt->long_name];
        if (!opt->repeatable)
            values.clear();
        values.push_back(opt_value);
    }

    return true;
}

std::optional<std::string> CliParser::get_option(const std::string& name) const {
    auto it = parsed_options_.find(name);
    if (it != parsed_options_.end() && !it->second.empty()) {
        return it->second.back();
    }

    // Return default value if exists
    const CliOption* opt = find_long(name);
    if (opt && !opt->default_value.empty()) {
        return opt->default_value;
    }

    return std::nullopt;
}

std::vector<std::string> CliParser::get_all(const std::string& name) const {
    auto it = parsed_options_.find(name);
    if (it == parsed_options_.end())
        return {};
    return it->second;
}

bool CliParser::has_option(const std::string& name) const {
    return parsed_options_.find(name) != parsed_options_.end();
}

void CliParser::print_options() const {
    printf("OPTIONS:\n");
    for (const auto& opt : options_) {
        std::string flag;
        if (opt.short_name != 0) {
            flag = std::string("-") + opt.short_name + ", ";
        } else {
            flag = "    ";
        }
        flag += "--" + opt.long_name;
        if (opt.takes_value)
            flag += " <VALUE>";
        printf("  %-28s %s", flag.c_str(), opt.description.c_str());
        if (!opt.default_value.empty())
            printf(" [default: %s]", opt.default_value.c_str());
        printf("\n");
    }
}

static void print_usage() {
    printf("Rover host tooling\n\n");
    printf("USAGE: roverctl [-v|-q] [--log-file FILE] <COMMAND>\n\n");
    printf("COMMANDS:\n");
    printf("  sync           Mirror the rover data log from the rover\n");
    printf("  provision      Bring this host to the rover's desired state\n");
    printf("  config         Inspect or create rover_config.json\n");
    printf("  log            Inspect a synced rover_data_log.json\n");
    printf("  help           Show this help\n");
    printf("  version        Show version\n");
}

static void print_version() {
    printf("roverctl version %s (code: %s)\n", VERSION_NAME, VERSION_CODE);
}

static std::optional<std::string> default_config_path() {
    auto user = resolve_target_user();
    if (!user) {
        LOGE("Cannot determine the target user, pass the config path explicitly");
        return std::nullopt;
    }
    return expand_home(ROVER_CONFIG_PATH, user->home);
}

static void print_rover_config(const RoverConfig& cfg) {
    printf("%s\n", cfg.to_json().dump(2).c_str());
}

// Config subcommand handlers
static int cmd_config(const std::vector<std::string>& args) {
    if (args.empty()) {
        printf("USAGE: roverctl config <SUBCOMMAND> [PATH]\n\n");
        printf("SUBCOMMANDS:\n");
        printf("  show [PATH]            Print the effective config (file over defaults)\n");
        printf("  check [PATH]           Validate the config\n");
        printf("  init [PATH] [--force]  Write the default config\n");
        return 1;
    }

    const std::string& subcmd = args[0];
    bool force = false;
    std::optional<std::string> path;
    for (size_t i = 1; i < args.size(); i++) {
        if (args[i] == "--force" || args[i] == "-f") {
            force = true;
        } else if (!path) {
            path = args[i];
        } else {
            printf("Unexpected argument: %s\n", args[i].c_str());
            return 1;
        }
    }
    if (!path) {
        path = default_config_path();
        if (!path)
            return 1;
    }

    if (subcmd == "init") {
        if (is_regular_file(*path) && !force) {
            printf("%s already exists, use --force to overwrite\n", path->c_str());
            return 1;
        }
        if (!RoverConfig::defaults().save(*path)) {
            LOGE("Failed to write %s", path->c_str());
            return 1;
        }
        printf("Wrote default config to %s\n", path->c_str());
        return 0;
    }

    RoverConfig cfg = RoverConfig::defaults();
    try {
        cfg = RoverConfig::load(*path);
    } catch (const ConfigError& e) {
        LOGE("%s: %s", path->c_str(), e.what());
        return 1;
    }

    if (subcmd == "show") {
        print_rover_config(cfg);
        return 0;
    } else if (subcmd == "check") {
        auto problems = cfg.validate();
        if (problems.empty()) {
            printf("%s: ok\n", path->c_str());
            return 0;
        }
        for (const auto& p : problems) {
            printf("%s: %s\n", path->c_str(), p.c_str());
        }
        return 1;
    }

    printf("Unknown config subcommand: %s\n", subcmd.c_str());
    return 1;
}

static void print_summary(const DataLogSummary& s) {
    printf("Entries:         %zu\n", s.entries);
    if (s.entries == 0)
        return;
    printf("First:           %s\n", s.first_timestamp.c_str());
    printf("Last:            %s\n", s.last_timestamp.c_str());
    printf("Last position:   x=%.2f y=%.2f heading=%.1f\n", s.last_position.x,
           s.last_position.y, s.last_position.heading);
    printf("With obstacles:  %zu\n", s.entries_with_obstacles);
    printf("Actions:\n");
    for (const auto& [action, count] : s.actions) {
        printf("  %-20s %zu\n", action.c_str(), count);
    }
}

// Data log subcommand handlers
static int cmd_log(const std::vector<std::string>& args) {
    if (args.empty()) {
        printf("USAGE: roverctl log <SUBCOMMAND> [FILE]\n\n");
        printf("SUBCOMMANDS:\n");
        printf("  summary [FILE]       Summarize the data log\n");
        printf("  csv [FILE] [OUT]     Export the data log as CSV (stdout by default)\n");
        return 1;
    }

    const std::string& subcmd = args[0];
    std::string path = args.size() > 1 ? args[1] : DATA_LOG_NAME;

    DataLog log;
    try {
        log = DataLog::load(path);
    } catch (const DataLogError& e) {
        LOGE("%s: %s", path.c_str(), e.what());
        return 1;
    }

    if (subcmd == "summary") {
        print_summary(log.summarize());
        return 0;
    } else if (subcmd == "csv") {
        if (args.size() > 2) {
            std::ofstream ofs(args[2]);
            if (!ofs) {
                LOGE("Cannot open %s for writing", args[2].c_str());
                return 1;
            }
            log.export_csv(ofs);
            if (!ofs) {
                LOGE("Failed to write %s", args[2].c_str());
                return 1;
            }
            printf("Exported %zu entries to %s\n", log.entries().size(), args[2].c_str());
        } else {
            log.export_csv(std::cout);
        }
        return 0;
    }

    printf("Unknown log subcommand: %s\n", subcmd.c_str());
    return 1;
}

int cli_run(int argc, char* argv[]) {
    // Initialize logging
    log_init("roverctl");

    // Global options come before the command
    int i = 1;
    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            log_set_level(LogLevel::DEBUG);
        } else if (arg == "-q" || arg == "--quiet") {
            log_set_level(LogLevel::WARN);
        } else if (arg == "--log-file" && i + 1 < argc) {
            if (!log_set_file(argv[++i]))
                return 1;
        } else if (starts_with(arg, "--log-file=")) {
            if (!log_set_file(arg.substr(11)))
                return 1;
        } else {
            break;
        }
    }

    if (i >= argc) {
        print_usage();
        return 0;
    }

    std::string cmd = argv[i];
    std::vector<std::string> args;
    for (int j = i + 1; j < argc; j++) {
        args.push_back(argv[j]);
    }

    LOGD("command: %s", cmd.c_str());

    // Dispatch commands
    if (cmd == "help" || cmd == "-h" || cmd == "--help") {
        print_usage();
        return 0;
    } else if (cmd == "version" || cmd == "-V" || cmd == "--version") {
        print_version();
        return 0;
    } else if (cmd == "sync") {
        return cmd_sync(args);
    } else if (cmd == "provision") {
        return cmd_provision(args);
    } else if (cmd == "config") {
        return cmd_config(args);
    } else if (cmd == "log") {
        return cmd_log(args);
    }

    printf("Unknown command: %s\n", cmd.c_str());
    print_usage();
    return 1;
}

}  // namespace roverctl
