#include "cloudmover/part_planner.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace cloudmover {

PartPlanner::PartPlanner(std::uint64_t max_part_size) : max_part_size_(max_part_size) {
    if (max_part_size_ == 0) {
        throw std::invalid_argument("max part size must be > 0");
    }
}

std::vector<Part> PartPlanner::plan(std::uint64_t object_size) const {
    std::vector<Part> parts;
    if (object_size == 0) {
        return parts;
    }
    const auto part_size = std::min(object_size, max_part_size_);
    const auto num_parts = object_size / part_size + (object_size % part_size == 0 ? 0 : 1);
    if (num_parts > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("object needs too many parts for the configured part size");
    }
    parts.reserve(static_cast<std::size_t>(num_parts));
    std::uint32_t index = 0;
    for (std::uint64_t offset = 0; offset < object_size; offset += part_size) {
        const auto length = std::min<std::uint64_t>(object_size - offset, part_size);
        parts.push_back(Part{index++, offset, length});
    }
    return parts;
}

std::size_t PartPlanner::effective_concurrency(std::size_t requested_workers, std::size_t num_parts) {
    if (requested_workers == 0) {
        throw std::invalid_argument("concurrency must be > 0");
    }
    return std::min(requested_workers, std::max<std::size_t>(num_parts, 1));
}

std::uint64_t PartPlanner::max_part_size() const noexcept { return max_part_size_; }

void check_transfer_settings(std::uint64_t max_part_size, std::size_t requested_workers) {
    if (max_part_size == 0) {
        throw std::invalid_argument("max part size must be > 0");
    }
    if (requested_workers == 0) {
        throw std::invalid_argument("concurrency must be > 0");
    }
}

} // namespace cloudmover
