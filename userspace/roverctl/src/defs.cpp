#include "defs.hpp"

#ifndef ROVERCTL_VERSION_NAME
#define ROVERCTL_VERSION_NAME "0.0.0-dev"
#endif  // #ifndef ROVERCTL_VERSION_NAME

#ifndef ROVERCTL_VERSION_CODE
#define ROVERCTL_VERSION_CODE "0"
#endif  // #ifndef ROVERCTL_VERSION_CODE

namespace roverctl {

const char* VERSION_CODE = ROVERCTL_VERSION_CODE;
const char* VERSION_NAME = ROVERCTL_VERSION_NAME;

}  // namespace roverctl
