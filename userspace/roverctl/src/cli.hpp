#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace roverctl {

int cli_run(int argc, char* argv[]);

// CLI argument parser helpers
struct CliOption {
    std::string long_name;
    char short_name;
    std::string description;
    bool takes_value;
    std::string default_value;
    bool repeatable = false;
};

class CliParser {
public:
    void add_option(const CliOption& opt);
    // Returns false on unknown options or a missing value
    bool parse(const std::vector<std::string>& args);

    std::optional<std::string> get_option(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has_option(const std::string& name) const;
    const std::vector<std::string>& positional() const { return positional_args_; }

    void print_options() const;

private:
    const CliOption* find_long(const std::string& name) const;
    const CliOption* find_short(char name) const;

    std::vector<CliOption> options_;
    std::map<std::string, std::vector<std::string>> parsed_options_;
    std::vector<std::string> positional_args_;
};

}  // namespace roverctl
