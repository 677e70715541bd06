#pragma once

#include "cloudmover/logging.hpp"
#include "cloudmover/part_planner.hpp"
#include "cloudmover/progress.hpp"
#include "cloudmover/retry_policy.hpp"
#include "cloudmover/storage.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace cloudmover {

// What happens to queued parts once one part has exhausted its retries.
enum class FailureMode {
    drain,          // every part still runs; the decision waits for all of them
    cancel_pending, // parts that have not started are recorded as cancelled
};

enum class TransferState { planning, copying, finalizing, done, aborting, failed };

const char *to_string(TransferState state) noexcept;

struct TransferOptions {
    std::uint64_t max_part_size = default_max_part_size;
    std::size_t concurrency = 4;
    FailureMode failure_mode = FailureMode::drain;
};

struct PartOutcome {
    enum class Status { pending, succeeded, failed, cancelled };

    Status status = Status::pending;
    std::uint64_t bytes = 0;
    std::uint32_t attempts = 0;
    std::string error;
};

struct TransferReport {
    std::uint64_t object_size = 0;
    std::size_t parts = 0;
    std::size_t concurrency = 0;
    std::uint64_t bytes_copied = 0;
    bool source_deleted = false;
    // Set when the destination was finalized but the source could not be deleted.
    std::string warning;
};

using DestinationOpener = std::function<std::unique_ptr<DestinationHandle>()>;

/**
 * Copies one object part by part and commits it at the destination.
 *
 * Parts are read and uploaded by a worker pool sized to the effective concurrency.
 * When every part succeeds the destination is finalized and the source removed;
 * otherwise the destination is aborted, the source is left alone, and the first
 * failure is thrown (PartTransferError or FinalizeError).
 */
class TransferOrchestrator {
  public:
    explicit TransferOrchestrator(Logger logger, RetryPolicy retry = RetryPolicy(),
                                  Sleeper sleeper = sleep_for);

    // The destination is opened only after the source size is known.
    TransferReport run(SourceHandle &source, const DestinationOpener &open_destination,
                       const TransferOptions &options, ProgressObserver *observer = nullptr);

    // Aborts `destination` if the source size cannot be determined.
    TransferReport run(SourceHandle &source, DestinationHandle &destination,
                       const TransferOptions &options, ProgressObserver *observer = nullptr);

    // State reached by the most recent run.
    TransferState state() const noexcept;

    const RetryPolicy &retry_policy() const noexcept;

  private:
    struct CopyState;

    static void validate(const TransferOptions &options);
    TransferReport execute(SourceHandle &source, std::uint64_t object_size,
                           DestinationHandle &destination, const TransferOptions &options,
                           ProgressObserver *observer);
    void copy_parts(SourceHandle &source, DestinationHandle &destination, const std::vector<Part> &parts,
                    std::size_t concurrency, FailureMode mode, ProgressCounter &progress,
                    CopyState &copy_state);
    PartOutcome copy_part(SourceHandle &source, DestinationHandle &destination, const Part &part,
                          ProgressCounter &progress);
    void abort_destination(DestinationHandle &destination);
    void enter(TransferState state);

    Logger logger_;
    RetryPolicy retry_;
    Sleeper sleeper_;
    TransferState state_{TransferState::planning};
};

} // namespace cloudmover
