#include "cli_options.hpp"

#include "cloudmover/errors.hpp"

#include <cassert>
#include <string>
#include <utility>
#include <vector>

namespace {

cloudmover::cli::CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "cloudmover");
    std::vector<char *> argv;
    for (auto &arg : args) {
        argv.push_back(arg.data());
    }
    return cloudmover::cli::parse_arguments(static_cast<int>(argv.size()), argv.data());
}

bool rejects(std::vector<std::string> args) {
    try {
        parse(std::move(args));
    } catch (const cloudmover::Error &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    auto defaults = parse({"s3://a/b", "gs://c/d"});
    assert(defaults.request.source == "s3://a/b");
    assert(defaults.request.destination == "gs://c/d");
    assert(defaults.request.concurrency == 4);
    assert(defaults.request.max_part_size == 64ull * 1024 * 1024);
    assert(defaults.request.progress);
    assert(defaults.request.failure_mode == cloudmover::FailureMode::drain);
    assert(!defaults.verbose);
    assert(!defaults.help);

    auto full = parse({"-t", "8", "--no-progress", "src.bin", "--part-size", "1048576", "-v",
                       "--cancel-on-failure", "dst.bin"});
    assert(full.request.concurrency == 8);
    assert(full.request.max_part_size == 1048576);
    assert(!full.request.progress);
    assert(full.request.failure_mode == cloudmover::FailureMode::cancel_pending);
    assert(full.verbose);
    assert(full.request.source == "src.bin");
    assert(full.request.destination == "dst.bin");

    auto long_threads = parse({"--threads", "2", "a", "b"});
    assert(long_threads.request.concurrency == 2);

    assert(parse({"--help"}).help);
    assert(parse({"a", "-h"}).help);

    assert(rejects({}));
    assert(rejects({"only-one"}));
    assert(rejects({"a", "b", "c"}));
    assert(rejects({"--threads", "0", "a", "b"}));
    assert(rejects({"--threads", "-3", "a", "b"}));
    assert(rejects({"--threads", "x", "a", "b"}));
    assert(rejects({"--part-size", "0", "a", "b"}));
    assert(rejects({"--part-size", "99999999999999999999999", "a", "b"}));
    assert(rejects({"a", "b", "--threads"}));
    assert(rejects({"--bogus", "a", "b"}));

    assert(cloudmover::cli::usage().find("--no-progress") != std::string::npos);
    return 0;
}
