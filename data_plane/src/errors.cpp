#include "cloudmover/errors.hpp"

#include <sstream>

namespace cloudmover {

namespace {

std::string describe_part_failure(std::uint32_t part_number, std::uint32_t attempts,
                                  const std::string &cause) {
    std::ostringstream oss;
    oss << "part " << part_number << " failed after " << attempts << " attempt"
        << (attempts == 1 ? "" : "s") << ": " << cause;
    return oss.str();
}

} // namespace

PartTransferError::PartTransferError(std::uint32_t part_number, std::uint32_t attempts,
                                     const std::string &cause)
    : TransferFailure(describe_part_failure(part_number, attempts, cause)),
      part_number_(part_number), attempts_(attempts) {}

} // namespace cloudmover
