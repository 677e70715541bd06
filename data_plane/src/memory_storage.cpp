#include "cloudmover/memory_storage.hpp"

#include "cloudmover/errors.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace cloudmover {

void MemoryObjectStore::put(const std::string &name, std::vector<char> data) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[name] = std::move(data);
}

std::optional<std::vector<char>> MemoryObjectStore::get(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(name);
    if (it == objects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::uint64_t MemoryObjectStore::size_of(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(name);
    if (it == objects_.end()) {
        throw NotFoundError("mem://" + name + " not found");
    }
    return it->second.size();
}

std::vector<char> MemoryObjectStore::read(const std::string &name, std::uint64_t offset,
                                          std::uint64_t length) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(name);
    if (it == objects_.end()) {
        throw NotFoundError("mem://" + name + " not found");
    }
    const auto &data = it->second;
    if (offset >= data.size()) {
        return {};
    }
    const auto end = offset + std::min<std::uint64_t>(length, data.size() - offset);
    return std::vector<char>(data.begin() + static_cast<std::ptrdiff_t>(offset),
                             data.begin() + static_cast<std::ptrdiff_t>(end));
}

bool MemoryObjectStore::erase(const std::string &name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.erase(name) > 0;
}

bool MemoryObjectStore::contains(const std::string &name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(name) > 0;
}

std::size_t MemoryObjectStore::object_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

MemorySource::MemorySource(std::shared_ptr<MemoryObjectStore> store, std::string name)
    : store_(std::move(store)), name_(std::move(name)) {
    if (!store_) {
        throw std::invalid_argument("memory source needs a store");
    }
}

std::uint64_t MemorySource::size() {
    if (!size_) {
        size_ = store_->size_of(name_);
    }
    return *size_;
}

std::vector<char> MemorySource::read_range(std::uint64_t offset, std::uint64_t length) {
    return store_->read(name_, offset, length);
}

void MemorySource::remove() {
    if (!store_->erase(name_)) {
        throw NotFoundError("mem://" + name_ + " already deleted");
    }
}

std::string MemorySource::describe() const { return "mem://" + name_; }

MemoryDestination::MemoryDestination(std::shared_ptr<MemoryObjectStore> store, std::string name,
                                     Logger logger)
    : store_(std::move(store)), name_(std::move(name)), logger_(std::move(logger)) {
    if (!store_ || !logger_) {
        throw std::invalid_argument("memory destination needs a store and a logger");
    }
}

void MemoryDestination::upload_part(std::uint32_t part_number, std::vector<char> data) {
    if (part_number == 0) {
        throw std::invalid_argument("part numbers start at 1");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw TransientIOError("upload session for mem://" + name_ + " is closed");
    }
    parts_[part_number] = std::move(data);
}

void MemoryDestination::finalize(std::uint32_t expected_parts) {
    std::vector<char> assembled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw FinalizeError("upload session for mem://" + name_ + " is already closed");
        }
        if (parts_.size() != expected_parts ||
            (!parts_.empty() && parts_.rbegin()->first != expected_parts)) {
            throw FinalizeError("mem://" + name_ + ": expected parts 1.." +
                                std::to_string(expected_parts) + ", have " +
                                std::to_string(parts_.size()) + " parts");
        }
        std::size_t total = 0;
        for (const auto &entry : parts_) {
            total += entry.second.size();
        }
        assembled.reserve(total);
        for (const auto &entry : parts_) {
            assembled.insert(assembled.end(), entry.second.begin(), entry.second.end());
        }
        parts_.clear();
        closed_ = true;
    }
    store_->put(name_, std::move(assembled));
    logger_->debug("mem://{} assembled from {} parts", name_, expected_parts);
}

void MemoryDestination::abort() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        logger_->warn("abort of mem://{} ignored: upload session already closed", name_);
        return;
    }
    logger_->debug("discarding {} staged parts of mem://{}", parts_.size(), name_);
    parts_.clear();
    closed_ = true;
}

std::string MemoryDestination::describe() const { return "mem://" + name_; }

std::size_t MemoryDestination::staged_parts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parts_.size();
}

} // namespace cloudmover
