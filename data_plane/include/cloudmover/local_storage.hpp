#pragma once

#include "cloudmover/logging.hpp"
#include "cloudmover/storage.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cloudmover {

class LocalFileSource : public SourceHandle {
  public:
    explicit LocalFileSource(std::filesystem::path path);

    std::uint64_t size() override;
    std::vector<char> read_range(std::uint64_t offset, std::uint64_t length) override;
    void remove() override;
    std::string describe() const override;

  private:
    std::filesystem::path path_;
    std::optional<std::uint64_t> size_;
};

/**
 * Stages every part as its own file next to the target:
 *   <target>.part-<session>-<part number>
 * finalize() concatenates the staged files in part order into
 * <target>.part-<session>-assembly and renames it over the target, so readers of
 * the target never observe a partial object.
 */
class LocalFileDestination : public DestinationHandle {
  public:
    LocalFileDestination(std::filesystem::path target, Logger logger);

    void upload_part(std::uint32_t part_number, std::vector<char> data) override;
    void finalize(std::uint32_t expected_parts) override;
    void abort() noexcept override;
    std::string describe() const override;

    std::filesystem::path staged_part_path(std::uint32_t part_number) const;

  private:
    std::filesystem::path assembly_path() const;
    void ensure_parent_directory() const;
    void discard_staged_files();

    std::filesystem::path target_;
    std::string session_;
    Logger logger_;

    std::mutex mutex_;
    std::set<std::uint32_t> parts_;  // fully written
    std::set<std::uint32_t> staged_; // may exist on disk, complete or not
    bool closed_{false};
};

} // namespace cloudmover
