#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cloudmover {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

// Unparseable locator, or no backend registered for its provider.
class LocatorError : public Error {
  public:
    explicit LocatorError(const std::string &msg) : Error(msg) {}
};

class NotFoundError : public Error {
  public:
    explicit NotFoundError(const std::string &msg) : Error(msg) {}
};

// Network/provider/filesystem failure that is worth retrying.
class TransientIOError : public Error {
  public:
    explicit TransientIOError(const std::string &msg) : Error(msg) {}
};

// Base of the errors that end a transfer in the aborted state.
class TransferFailure : public Error {
  public:
    explicit TransferFailure(const std::string &msg) : Error(msg) {}
};

class PartTransferError : public TransferFailure {
  public:
    PartTransferError(std::uint32_t part_number, std::uint32_t attempts, const std::string &cause);

    std::uint32_t part_number() const noexcept { return part_number_; }
    std::uint32_t attempts() const noexcept { return attempts_; }

  private:
    std::uint32_t part_number_;
    std::uint32_t attempts_;
};

class FinalizeError : public TransferFailure {
  public:
    explicit FinalizeError(const std::string &msg) : TransferFailure(msg) {}
};

// Raised inside destination cleanup; abort() catches and logs it.
class AbortError : public Error {
  public:
    explicit AbortError(const std::string &msg) : Error(msg) {}
};

} // namespace cloudmover
