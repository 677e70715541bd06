#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cloudmover {

// Read side of a move. Implementations must allow concurrent read_range calls.
class SourceHandle {
  public:
    virtual ~SourceHandle() = default;

    // Throws NotFoundError when the object does not exist.
    virtual std::uint64_t size() = 0;

    // Returns exactly `length` bytes, or the tail when the range runs past the end.
    // Throws TransientIOError.
    virtual std::vector<char> read_range(std::uint64_t offset, std::uint64_t length) = 0;

    // Deletes the object. Throws TransientIOError, or NotFoundError if already gone.
    virtual void remove() = 0;

    virtual std::string describe() const = 0;
};

// Write side of a move. upload_part may be called concurrently; the orchestrator
// makes exactly one terminal call (finalize or abort) after all uploads have returned.
class DestinationHandle {
  public:
    virtual ~DestinationHandle() = default;

    // part_number is 1-based. Re-uploading a number replaces the earlier data.
    virtual void upload_part(std::uint32_t part_number, std::vector<char> data) = 0;

    // Assembles parts 1..expected_parts in ascending order. Zero parts yields an empty
    // object. Throws FinalizeError when the uploaded set is not exactly 1..expected_parts.
    virtual void finalize(std::uint32_t expected_parts) = 0;

    // Best effort. Never throws.
    virtual void abort() noexcept = 0;

    virtual std::string describe() const = 0;
};

} // namespace cloudmover
