#include "cloudmover/part_planner.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace {

constexpr std::uint64_t MiB = 1024 * 1024;

void check_partition(std::uint64_t size, std::uint64_t max_part_size) {
    cloudmover::PartPlanner planner(max_part_size);
    auto parts = planner.plan(size);
    assert((parts.empty()) == (size == 0));
    std::uint64_t expected_offset = 0;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        assert(parts[i].index == i);
        assert(parts[i].part_number() == i + 1);
        assert(parts[i].offset == expected_offset);
        assert(parts[i].length > 0);
        assert(parts[i].length <= max_part_size);
        if (i + 1 < parts.size()) {
            assert(parts[i].length == std::min(size, max_part_size));
        }
        expected_offset += parts[i].length;
    }
    assert(expected_offset == size);
}

} // namespace

int main() {
    for (std::uint64_t size : {0ull, 1ull, 2ull, 7ull, 255ull, 256ull, 257ull, 1024ull, 100003ull}) {
        for (std::uint64_t max_part : {1ull, 3ull, 256ull, 1024ull, 4096ull}) {
            check_partition(size, max_part);
        }
    }

    cloudmover::PartPlanner default_planner;
    assert(default_planner.max_part_size() == 64 * MiB);

    auto parts = default_planner.plan(150 * MiB);
    assert(parts.size() == 3);
    assert(parts[0].length == 64 * MiB);
    assert(parts[1].length == 64 * MiB);
    assert(parts[2].length == 22 * MiB);
    assert(parts[2].offset == 128 * MiB);
    assert(parts[0].part_number() == 1 && parts[1].part_number() == 2 && parts[2].part_number() == 3);
    assert(cloudmover::PartPlanner::effective_concurrency(4, parts.size()) == 3);

    // A small object becomes a single part of its own size.
    auto small = default_planner.plan(1000);
    assert(small.size() == 1);
    assert(small[0].offset == 0 && small[0].length == 1000);

    assert(default_planner.plan(0).empty());

    assert(cloudmover::PartPlanner::effective_concurrency(10, 2) == 2);
    assert(cloudmover::PartPlanner::effective_concurrency(4, 0) == 1);
    assert(cloudmover::PartPlanner::effective_concurrency(1, 50) == 1);
    assert(cloudmover::PartPlanner::effective_concurrency(8, 8) == 8);

    bool threw = false;
    try {
        cloudmover::PartPlanner zero(0);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        cloudmover::PartPlanner::effective_concurrency(0, 3);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    return 0;
}
