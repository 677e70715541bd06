#include "cloudmover/mover.hpp"

#include "cloudmover/errors.hpp"
#include "cloudmover/locator.hpp"

#include <memory>
#include <utility>

namespace cloudmover {

TransferReport transfer(const TransferRequest &request, const BackendRegistry &registry,
                        const Logger &logger, ProgressObserver *observer, RetryPolicy retry,
                        Sleeper sleeper) {
    // Reject bad settings before touching either backend.
    check_transfer_settings(request.max_part_size, request.concurrency);

    const auto source_locator = parse_locator(request.source);
    const auto destination_locator = parse_locator(request.destination);
    if (same_object(source_locator, destination_locator)) {
        throw LocatorError("source and destination name the same object: " + source_locator.text +
                           " -> " + destination_locator.text);
    }
    if (!registry.has_destination(destination_locator.provider)) {
        throw LocatorError("Unsupported destination provider: " + destination_locator.provider +
                           " (" + destination_locator.text + ")");
    }

    auto source = registry.open_source(source_locator, logger);
    TransferOptions options;
    options.max_part_size = request.max_part_size;
    options.concurrency = request.concurrency;
    options.failure_mode = request.failure_mode;

    TransferOrchestrator orchestrator(logger, retry, std::move(sleeper));
    return orchestrator.run(
        *source, [&] { return registry.open_destination(destination_locator, logger); }, options,
        request.progress ? observer : nullptr);
}

} // namespace cloudmover
