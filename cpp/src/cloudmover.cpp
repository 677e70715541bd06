#include "cli_options.hpp"

#include "cloudmover/backend_registry.hpp"
#include "cloudmover/errors.hpp"
#include "cloudmover/logging.hpp"
#include "cloudmover/memory_storage.hpp"
#include "cloudmover/mover.hpp"
#include "cloudmover/progress.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

int main(int argc, char **argv) {
    cloudmover::cli::CliOptions opts;
    try {
        opts = cloudmover::cli::parse_arguments(argc, argv);
    } catch (const cloudmover::Error &err) {
        std::cerr << "error: " << err.what() << '\n' << cloudmover::cli::usage();
        return EXIT_FAILURE;
    }
    if (opts.help) {
        std::cout << cloudmover::cli::usage();
        return EXIT_SUCCESS;
    }

    auto logger = cloudmover::make_console_logger("cloudmover", opts.verbose);
    auto registry =
        cloudmover::BackendRegistry::with_builtin_backends(std::make_shared<cloudmover::MemoryObjectStore>());
    cloudmover::ConsoleProgress progress(std::cerr);

    try {
        auto report = cloudmover::transfer(opts.request, registry, logger, &progress);
        if (!report.warning.empty()) {
            std::cerr << "warning: " << report.warning << std::endl;
        }
    } catch (const std::exception &err) {
        std::cerr << "error: Failed to move file: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
