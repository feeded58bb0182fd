#include "cli.hpp"

int main(int argc, char* argv[]) {
    return roverctl::cli_run(argc, argv);
}
