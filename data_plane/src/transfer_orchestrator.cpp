#include "cloudmover/transfer_orchestrator.hpp"

#include "cloudmover/errors.hpp"
#include "cloudmover/worker_pool.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cloudmover {

const char *to_string(TransferState state) noexcept {
    switch (state) {
    case TransferState::planning:
        return "PLANNING";
    case TransferState::copying:
        return "COPYING";
    case TransferState::finalizing:
        return "FINALIZING";
    case TransferState::done:
        return "DONE";
    case TransferState::aborting:
        return "ABORTING";
    case TransferState::failed:
        return "FAILED";
    }
    return "UNKNOWN";
}

// Outcome table shared by the workers of one transfer.
struct TransferOrchestrator::CopyState {
    explicit CopyState(std::size_t num_parts) : outcomes(num_parts) {}

    void record(std::size_t index, PartOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex);
        if (outcome.status == PartOutcome::Status::failed && !first_failure) {
            first_failure = index;
            failed.store(true);
        }
        outcomes[index] = std::move(outcome);
    }

    std::mutex mutex;
    std::vector<PartOutcome> outcomes;
    std::optional<std::size_t> first_failure;
    std::atomic<bool> failed{false};
};

TransferOrchestrator::TransferOrchestrator(Logger logger, RetryPolicy retry, Sleeper sleeper)
    : logger_(std::move(logger)), retry_(retry), sleeper_(std::move(sleeper)) {
    if (!logger_) {
        throw std::invalid_argument("orchestrator needs a logger");
    }
    if (!sleeper_) {
        throw std::invalid_argument("orchestrator needs a sleeper");
    }
}

TransferReport TransferOrchestrator::run(SourceHandle &source, const DestinationOpener &open_destination,
                                         const TransferOptions &options, ProgressObserver *observer) {
    state_ = TransferState::planning;
    validate(options);
    const auto object_size = source.size();
    auto destination = open_destination();
    if (!destination) {
        throw std::invalid_argument("destination opener returned no handle");
    }
    return execute(source, object_size, *destination, options, observer);
}

TransferReport TransferOrchestrator::run(SourceHandle &source, DestinationHandle &destination,
                                         const TransferOptions &options, ProgressObserver *observer) {
    state_ = TransferState::planning;
    std::uint64_t object_size = 0;
    try {
        validate(options);
        object_size = source.size();
    } catch (const std::exception &e) {
        logger_->error("cannot plan transfer from {}: {}", source.describe(), e.what());
        abort_destination(destination);
        enter(TransferState::failed);
        throw;
    }
    return execute(source, object_size, destination, options, observer);
}

TransferState TransferOrchestrator::state() const noexcept { return state_; }

const RetryPolicy &TransferOrchestrator::retry_policy() const noexcept { return retry_; }

TransferReport TransferOrchestrator::execute(SourceHandle &source, std::uint64_t object_size,
                                             DestinationHandle &destination,
                                             const TransferOptions &options,
                                             ProgressObserver *observer) {
    const PartPlanner planner(options.max_part_size);
    const auto parts = planner.plan(object_size);
    const auto concurrency = PartPlanner::effective_concurrency(options.concurrency, parts.size());

    TransferReport report;
    report.object_size = object_size;
    report.parts = parts.size();
    report.concurrency = concurrency;

    logger_->info("Starting transfer: {} ({} bytes) -> {}", source.describe(), object_size,
                  destination.describe());
    logger_->debug("{} parts of at most {} bytes, {} workers", parts.size(), planner.max_part_size(),
                   concurrency);

    ProgressCounter progress(object_size, observer);
    CopyState copy_state(parts.size());

    if (!parts.empty()) {
        enter(TransferState::copying);
        try {
            copy_parts(source, destination, parts, concurrency, options.failure_mode, progress, copy_state);
        } catch (const std::exception &e) {
            logger_->error("Transfer failed: {}", e.what());
            enter(TransferState::aborting);
            abort_destination(destination);
            enter(TransferState::failed);
            throw;
        }
    }

    for (const auto &outcome : copy_state.outcomes) {
        if (outcome.status == PartOutcome::Status::pending) {
            logger_->error("Transfer failed: part left without an outcome after the workers joined");
            enter(TransferState::aborting);
            abort_destination(destination);
            enter(TransferState::failed);
            if (observer != nullptr) {
                observer->on_finished(false);
            }
            throw std::logic_error("part left without an outcome after the workers joined");
        }
    }
    report.bytes_copied = progress.transferred();

    if (copy_state.first_failure) {
        const auto index = *copy_state.first_failure;
        const auto &outcome = copy_state.outcomes[index];
        PartTransferError error(parts[index].part_number(), outcome.attempts, outcome.error);
        logger_->error("Transfer failed: {}", error.what());
        enter(TransferState::aborting);
        abort_destination(destination);
        enter(TransferState::failed);
        if (observer != nullptr) {
            observer->on_finished(false);
        }
        throw error;
    }

    enter(TransferState::finalizing);
    try {
        destination.finalize(static_cast<std::uint32_t>(parts.size()));
    } catch (const std::exception &e) {
        const auto *finalize_error = dynamic_cast<const FinalizeError *>(&e);
        FinalizeError error(finalize_error != nullptr
                                ? std::string(e.what())
                                : "finalize of " + destination.describe() + " failed: " + e.what());
        logger_->error("Transfer failed: {}", error.what());
        enter(TransferState::aborting);
        abort_destination(destination);
        enter(TransferState::failed);
        if (observer != nullptr) {
            observer->on_finished(false);
        }
        throw error;
    }
    if (observer != nullptr) {
        observer->on_finished(true);
    }

    try {
        source.remove();
        report.source_deleted = true;
    } catch (const std::exception &e) {
        report.warning = "destination is complete but source " + source.describe() +
                         " could not be deleted: " + e.what();
        logger_->warn("{}", report.warning);
    }

    enter(TransferState::done);
    if (report.source_deleted) {
        logger_->info("Transfer completed successfully. Source object deleted.");
    } else {
        logger_->info("Transfer completed; source object left in place.");
    }
    return report;
}

void TransferOrchestrator::copy_parts(SourceHandle &source, DestinationHandle &destination,
                                      const std::vector<Part> &parts, std::size_t concurrency,
                                      FailureMode mode, ProgressCounter &progress, CopyState &copy_state) {
    WorkerPool pool(concurrency);
    for (const auto &part : parts) {
        pool.submit([&, part] {
            if (mode == FailureMode::cancel_pending && copy_state.failed.load()) {
                PartOutcome cancelled;
                cancelled.status = PartOutcome::Status::cancelled;
                logger_->debug("part {} cancelled after an earlier failure", part.part_number());
                copy_state.record(part.index, std::move(cancelled));
                return;
            }
            PartOutcome outcome;
            try {
                outcome = copy_part(source, destination, part, progress);
            } catch (...) {
                outcome.status = PartOutcome::Status::failed;
                outcome.error = "non-standard exception while copying part";
            }
            copy_state.record(part.index, std::move(outcome));
        });
    }
    pool.wait_for_completion();
}

PartOutcome TransferOrchestrator::copy_part(SourceHandle &source, DestinationHandle &destination,
                                            const Part &part, ProgressCounter &progress) {
    PartOutcome outcome;
    for (std::uint32_t attempt = 1;; ++attempt) {
        outcome.attempts = attempt;
        bool copied = false;
        try {
            auto data = source.read_range(part.offset, part.length);
            if (data.size() != part.length) {
                throw TransientIOError("short read for part " + std::to_string(part.part_number()) +
                                       ": expected " + std::to_string(part.length) + " bytes, got " +
                                       std::to_string(data.size()));
            }
            destination.upload_part(part.part_number(), std::move(data));
            copied = true;
        } catch (const std::exception &e) {
            outcome.error = e.what();
            logger_->debug("Error transferring part {} (attempt {}): {}", part.part_number(), attempt,
                           e.what());
        }
        if (copied) {
            outcome.status = PartOutcome::Status::succeeded;
            outcome.bytes = part.length;
            outcome.error.clear();
            try {
                progress.add(part.length);
            } catch (const std::exception &e) {
                logger_->warn("progress observer failed after part {}: {}", part.part_number(), e.what());
            }
            logger_->trace("part {} copied ({} bytes, attempt {})", part.part_number(), part.length,
                           attempt);
            return outcome;
        }
        if (!retry_.should_retry(attempt)) {
            outcome.status = PartOutcome::Status::failed;
            return outcome;
        }
        sleeper_(retry_.backoff(attempt));
    }
}

void TransferOrchestrator::validate(const TransferOptions &options) {
    check_transfer_settings(options.max_part_size, options.concurrency);
}

void TransferOrchestrator::abort_destination(DestinationHandle &destination) {
    logger_->debug("aborting {}", destination.describe());
    destination.abort();
}

void TransferOrchestrator::enter(TransferState state) {
    logger_->debug("transfer state {} -> {}", to_string(state_), to_string(state));
    state_ = state;
}

} // namespace cloudmover
