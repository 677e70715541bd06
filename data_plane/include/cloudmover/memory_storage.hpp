#pragma once

#include "cloudmover/logging.hpp"
#include "cloudmover/storage.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cloudmover {

// Thread-safe in-process object store addressed by "container/key".
class MemoryObjectStore {
  public:
    void put(const std::string &name, std::vector<char> data);

    std::optional<std::vector<char>> get(const std::string &name) const;

    // Throws NotFoundError.
    std::uint64_t size_of(const std::string &name) const;

    // Throws NotFoundError. Returns the tail when the range runs past the end.
    std::vector<char> read(const std::string &name, std::uint64_t offset, std::uint64_t length) const;

    bool erase(const std::string &name);

    bool contains(const std::string &name) const;

    std::size_t object_count() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<char>> objects_;
};

class MemorySource : public SourceHandle {
  public:
    MemorySource(std::shared_ptr<MemoryObjectStore> store, std::string name);

    std::uint64_t size() override;
    std::vector<char> read_range(std::uint64_t offset, std::uint64_t length) override;
    void remove() override;
    std::string describe() const override;

  private:
    std::shared_ptr<MemoryObjectStore> store_;
    std::string name_;
    std::optional<std::uint64_t> size_;
};

// Keeps parts in memory and publishes the assembled object in one step.
class MemoryDestination : public DestinationHandle {
  public:
    MemoryDestination(std::shared_ptr<MemoryObjectStore> store, std::string name, Logger logger);

    void upload_part(std::uint32_t part_number, std::vector<char> data) override;
    void finalize(std::uint32_t expected_parts) override;
    void abort() noexcept override;
    std::string describe() const override;

    std::size_t staged_parts() const;

  private:
    std::shared_ptr<MemoryObjectStore> store_;
    std::string name_;
    Logger logger_;

    mutable std::mutex mutex_;
    std::map<std::uint32_t, std::vector<char>> parts_;
    bool closed_{false};
};

} // namespace cloudmover
