// provision/provision_cli.hpp - `roverctl provision`
#pragma once

#include <string>
#include <vector>

namespace roverctl {

// Returns: 0 when every resource converged (or would, for --dry-run)
int cmd_provision(const std::vector<std::string>& args);

}  // namespace roverctl
