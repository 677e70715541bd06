#pragma once

#include "cloudmover/mover.hpp"

#include <string>

namespace cloudmover::cli {

struct CliOptions {
    TransferRequest request;
    bool verbose = false;
    bool help = false;
};

// Parses argv[1..argc). Throws cloudmover::Error on unknown or incomplete options.
CliOptions parse_arguments(int argc, char **argv);

std::string usage();

} // namespace cloudmover::cli
