#include "cli_options.hpp"

#include "cloudmover/errors.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

namespace cloudmover::cli {

namespace {

std::uint64_t parse_unsigned(const std::string &option, const std::string &value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw Error("option " + option + " expects a positive integer, got '" + value + "'");
    }
    try {
        return static_cast<std::uint64_t>(std::stoull(value));
    } catch (const std::out_of_range &) {
        throw Error("option " + option + " is out of range: " + value);
    }
}

} // namespace

CliOptions parse_arguments(int argc, char **argv) {
    CliOptions opts;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            opts.request.concurrency = static_cast<std::size_t>(parse_unsigned(arg, argv[++i]));
        } else if ((arg == "-p" || arg == "--part-size") && i + 1 < argc) {
            opts.request.max_part_size = parse_unsigned(arg, argv[++i]);
        } else if (arg == "--no-progress") {
            opts.request.progress = false;
        } else if (arg == "--cancel-on-failure") {
            opts.request.failure_mode = FailureMode::cancel_pending;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::ostringstream oss;
            oss << "unknown or incomplete option: " << arg;
            throw Error(oss.str());
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 2) {
        throw Error("expected a source and a destination");
    }
    if (opts.request.concurrency == 0) {
        throw Error("--threads must be > 0");
    }
    if (opts.request.max_part_size == 0) {
        throw Error("--part-size must be > 0");
    }
    opts.request.source = positional[0];
    opts.request.destination = positional[1];
    return opts;
}

std::string usage() {
    return "Usage:\n"
           "  cloudmover [options] <source> <destination>\n"
           "\n"
           "Move a large object between storage locations (local paths or file:// URLs;\n"
           "s3://, gs:// and azure:// need a registered adapter).\n"
           "\n"
           "Options:\n"
           "  -t, --threads N          number of parallel workers (default 4)\n"
           "  -p, --part-size BYTES    maximum part size (default 67108864)\n"
           "      --no-progress        disable the progress bar\n"
           "      --cancel-on-failure  skip queued parts once a part has failed\n"
           "  -v, --verbose            enable debug logging\n"
           "  -h, --help               show this help\n";
}

} // namespace cloudmover::cli
