#pragma once

#include "cloudmover/backend_registry.hpp"
#include "cloudmover/logging.hpp"
#include "cloudmover/part_planner.hpp"
#include "cloudmover/progress.hpp"
#include "cloudmover/retry_policy.hpp"
#include "cloudmover/transfer_orchestrator.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace cloudmover {

struct TransferRequest {
    std::string source;
    std::string destination;
    std::uint64_t max_part_size = default_max_part_size;
    std::size_t concurrency = 4;
    bool progress = true;
    FailureMode failure_mode = FailureMode::drain;
};

/**
 * Moves request.source to request.destination.
 *
 * Locators are parsed and the source size is read before the destination is
 * opened, so LocatorError and NotFoundError leave no destination state behind.
 * `observer` only receives updates when request.progress is set. Throws
 * TransferFailure when the destination had to be aborted.
 */
TransferReport transfer(const TransferRequest &request, const BackendRegistry &registry,
                        const Logger &logger, ProgressObserver *observer = nullptr,
                        RetryPolicy retry = RetryPolicy(), Sleeper sleeper = sleep_for);

} // namespace cloudmover
