#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace cloudmover {

constexpr std::uint64_t default_max_part_size = 64ull * 1024 * 1024;

struct Part {
    std::uint32_t index;
    std::uint64_t offset;
    std::uint64_t length;

    // Providers number parts from 1.
    std::uint32_t part_number() const noexcept { return index + 1; }
};

class PartPlanner {
  public:
    explicit PartPlanner(std::uint64_t max_part_size = default_max_part_size);

    // Ordered, disjoint parts covering [0, object_size). Empty for a zero-length object.
    std::vector<Part> plan(std::uint64_t object_size) const;

    // Never more workers than parts, never zero workers.
    static std::size_t effective_concurrency(std::size_t requested_workers, std::size_t num_parts);

    std::uint64_t max_part_size() const noexcept;

  private:
    std::uint64_t max_part_size_;
};

// Throws std::invalid_argument for a zero part size or zero workers.
void check_transfer_settings(std::uint64_t max_part_size, std::size_t requested_workers);

} // namespace cloudmover
