// provision/provision_cli.cpp - `roverctl provision`
#include "provision_cli.hpp"
#include "../cli.hpp"
#include "../log.hpp"
#include "../utils.hpp"
#include "converge.hpp"
#include "host.hpp"
#include "manifest.hpp"

#include <unistd.h>
#include <cstdio>
#include <optional>

namespace roverctl {

static void print_provision_help(const CliParser& parser) {
    printf("USAGE: roverctl provision [OPTIONS]\n");
    printf("       roverctl provision dump [--manifest FILE]\n\n");
    printf("Brings this host to the state described by the manifest. Without\n");
    printf("--manifest the built-in rover host description is used.\n\n");
    parser.print_options();
}

static void print_item(const ResourceReport& item) {
    printf("  [%-7s] %s", outcome_name(item.outcome), item.name.c_str());
    if (!item.detail.empty())
        printf(": %s", item.detail.c_str());
    printf("\n");
    fflush(stdout);
}

static void print_complete() {
    printf("\n");
    printf("==========================================\n");
    printf("  ✓ Setup Complete!\n");
    printf("==========================================\n");
    printf("\n");
    printf("IMPORTANT: Please reboot your Raspberry Pi\n");
    printf("Run: sudo reboot\n");
    printf("\n");
    printf("After reboot, verify I2C is working:\n");
    printf("  sudo i2cdetect -y 1\n");
    printf("\n");
    printf("To test components individually:\n");
    printf("  python3 sensor_manager.py\n");
    printf("  python3 motor_controller.py\n");
    printf("  python3 obstacle_detector.py\n");
    printf("\n");
    printf("To run the complete rover system:\n");
    printf("  python3 rover_main.py\n");
}

static std::optional<Manifest> load_manifest(const CliParser& parser) {
    auto path = parser.get_option("manifest");
    if (!path)
        return Manifest::rover_default();
    try {
        return Manifest::load(*path);
    } catch (const ManifestError& e) {
        LOGE("%s", e.what());
        return std::nullopt;
    }
}

int cmd_provision(const std::vector<std::string>& args) {
    CliParser parser;
    parser.add_option({"manifest", 'm', "Read the desired state from a JSON manifest", true, ""});
    parser.add_option({"dry-run", 'n', "Only report what would change", false, ""});
    parser.add_option({"keep-going", 'k', "Continue after a critical failure", false, ""});
    parser.add_option({"user", 'u', "Target user (default: $SUDO_USER or the caller)", true, ""});
    parser.add_option({"root", 0, "Prefix for every filesystem path", true, ""});
    parser.add_option({"help", 'h', "Show this help", false, ""});

    if (!parser.parse(args)) {
        print_provision_help(parser);
        return 1;
    }
    if (parser.has_option("help")) {
        print_provision_help(parser);
        return 0;
    }

    const auto& positional = parser.positional();
    bool dump = false;
    if (!positional.empty()) {
        if (positional[0] != "dump" || positional.size() > 1) {
            printf("Unexpected argument: %s\n", positional.back().c_str());
            return 1;
        }
        dump = true;
    }

    auto manifest = load_manifest(parser);
    if (!manifest)
        return 1;

    if (dump) {
        printf("%s\n", manifest->to_json().dump(2).c_str());
        return 0;
    }

    std::optional<UserInfo> user;
    if (auto name = parser.get_option("user")) {
        user = lookup_user(*name);
        if (!user) {
            LOGE("Unknown user: %s", name->c_str());
            return 1;
        }
    } else {
        user = resolve_target_user();
        if (!user) {
            LOGE("Cannot determine the target user, use --user");
            return 1;
        }
    }

    ConvergeOptions opts;
    opts.dry_run = parser.has_option("dry-run");
    opts.keep_going = parser.has_option("keep-going");

    SystemRunner runner;
    Host host{*user, runner, parser.get_option("root").value_or("")};

    if (!opts.dry_run && geteuid() != 0)
        LOGW("Not running as root, system changes will likely fail");

    LOGI("Provisioning for user %s (%s)", host.user.name.c_str(), host.user.home.c_str());
    printf("%s %zu resource(s) for %s\n", opts.dry_run ? "Checking" : "Converging",
           manifest->resources().size(), host.user.name.c_str());

    Report report = converge(*manifest, host, opts, print_item);

    printf("\n%zu ok, %zu changed, %zu pending, %zu warning, %zu failed, %zu skipped\n",
           report.count(Outcome::Ok), report.count(Outcome::Changed),
           report.count(Outcome::Pending), report.count(Outcome::Warning),
           report.count(Outcome::Failed), report.count(Outcome::Skipped));

    if (!report.ok()) {
        printf("Setup did not complete, see the failures above\n");
        return 1;
    }
    if (opts.dry_run) {
        printf("Dry run: %zu resource(s) would change\n", report.count(Outcome::Pending));
        return 0;
    }

    print_complete();
    return 0;
}

}  // namespace roverctl
