#include "cloudmover/local_storage.hpp"

#include "cloudmover/errors.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cloudmover {

namespace {

constexpr std::size_t kBufferSize = 4 * 1024 * 1024;

std::string errno_message(const std::string &what, const std::filesystem::path &path, int err) {
    std::ostringstream oss;
    oss << what << " '" << path.string() << "': " << std::strerror(err);
    return oss.str();
}

class FileDescriptor {
  public:
    FileDescriptor(const std::filesystem::path &path, int flags, mode_t mode = 0644)
        : fd_(::open(path.c_str(), flags | O_CLOEXEC, mode)), errno_(fd_ < 0 ? errno : 0) {}

    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor &) = delete;
    FileDescriptor &operator=(const FileDescriptor &) = delete;

    bool valid() const { return fd_ >= 0; }
    int get() const { return fd_; }
    int open_errno() const { return errno_; }

    // Reports close() failures, which can carry delayed write errors.
    int close() {
        int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

  private:
    int fd_;
    int errno_;
};

template <typename ErrorType>
void write_all(int fd, const char *data, std::size_t length, const std::filesystem::path &path) {
    std::size_t written = 0;
    while (written < length) {
        ssize_t rc = ::write(fd, data + written, length - written);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ErrorType(errno_message("write failed for", path, errno));
        }
        written += static_cast<std::size_t>(rc);
    }
}

std::string make_session_id() {
    std::random_device device;
    std::mt19937_64 engine(device());
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << engine();
    return oss.str();
}

} // namespace

LocalFileSource::LocalFileSource(std::filesystem::path path) : path_(std::move(path)) {}

std::uint64_t LocalFileSource::size() {
    if (size_) {
        return *size_;
    }
    struct stat info;
    if (::stat(path_.c_str(), &info) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            throw NotFoundError("source file not found: " + path_.string());
        }
        throw TransientIOError(errno_message("stat failed for", path_, errno));
    }
    if (!S_ISREG(info.st_mode)) {
        throw NotFoundError("source is not a regular file: " + path_.string());
    }
    size_ = static_cast<std::uint64_t>(info.st_size);
    return *size_;
}

std::vector<char> LocalFileSource::read_range(std::uint64_t offset, std::uint64_t length) {
    FileDescriptor fd(path_, O_RDONLY);
    if (!fd.valid()) {
        throw TransientIOError(errno_message("failed to open source file", path_, fd.open_errno()));
    }
    std::vector<char> buffer(static_cast<std::size_t>(length));
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        ssize_t rc = ::pread(fd.get(), buffer.data() + filled, buffer.size() - filled,
                             static_cast<off_t>(offset + filled));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TransientIOError(errno_message("read failed for", path_, errno));
        }
        if (rc == 0) {
            break;
        }
        filled += static_cast<std::size_t>(rc);
    }
    buffer.resize(filled);
    return buffer;
}

void LocalFileSource::remove() {
    if (::unlink(path_.c_str()) != 0) {
        if (errno == ENOENT) {
            throw NotFoundError("source file already gone: " + path_.string());
        }
        throw TransientIOError(errno_message("failed to delete", path_, errno));
    }
}

std::string LocalFileSource::describe() const { return path_.string(); }

LocalFileDestination::LocalFileDestination(std::filesystem::path target, Logger logger)
    : target_(std::move(target)), session_(make_session_id()), logger_(std::move(logger)) {
    if (target_.empty() || !target_.has_filename()) {
        throw std::invalid_argument("destination path must name a file: " + target_.string());
    }
    if (!logger_) {
        throw std::invalid_argument("file destination needs a logger");
    }
}

std::filesystem::path LocalFileDestination::staged_part_path(std::uint32_t part_number) const {
    auto path = target_;
    path += ".part-" + session_ + "-" + std::to_string(part_number);
    return path;
}

std::filesystem::path LocalFileDestination::assembly_path() const {
    auto path = target_;
    path += ".part-" + session_ + "-assembly";
    return path;
}

void LocalFileDestination::ensure_parent_directory() const {
    const auto parent = target_.parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw TransientIOError("failed to create directory '" + parent.string() + "': " + ec.message());
    }
}

void LocalFileDestination::upload_part(std::uint32_t part_number, std::vector<char> data) {
    if (part_number == 0) {
        throw std::invalid_argument("part numbers start at 1");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw TransientIOError("upload session for " + target_.string() + " is closed");
        }
        // Truncation below invalidates an earlier copy of this part.
        parts_.erase(part_number);
        staged_.insert(part_number);
    }
    ensure_parent_directory();
    const auto path = staged_part_path(part_number);
    try {
        FileDescriptor fd(path, O_CREAT | O_WRONLY | O_TRUNC);
        if (!fd.valid()) {
            throw TransientIOError(errno_message("failed to stage part", path, fd.open_errno()));
        }
        write_all<TransientIOError>(fd.get(), data.data(), data.size(), path);
        if (fd.close() != 0) {
            throw TransientIOError(errno_message("failed to close staged part", path, errno));
        }
    } catch (const TransientIOError &) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            logger_->warn("Failed to delete partial staged part {}: {}", path.string(), ec.message());
        }
        throw;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    parts_.insert(part_number);
}

void LocalFileDestination::finalize(std::uint32_t expected_parts) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw FinalizeError("upload session for " + target_.string() + " is already closed");
    }
    if (parts_.size() != expected_parts || (!parts_.empty() && *parts_.rbegin() != expected_parts)) {
        throw FinalizeError(target_.string() + ": expected parts 1.." + std::to_string(expected_parts) +
                            ", have " + std::to_string(parts_.size()) + " parts");
    }
    try {
        ensure_parent_directory();
    } catch (const TransientIOError &e) {
        throw FinalizeError(e.what());
    }

    const auto assembly = assembly_path();
    {
        FileDescriptor out(assembly, O_CREAT | O_WRONLY | O_TRUNC);
        if (!out.valid()) {
            throw FinalizeError(errno_message("failed to create", assembly, out.open_errno()));
        }
        std::vector<char> buffer(kBufferSize);
        for (auto part_number : parts_) {
            const auto staged = staged_part_path(part_number);
            FileDescriptor in(staged, O_RDONLY);
            if (!in.valid()) {
                throw FinalizeError(errno_message("missing staged part", staged, in.open_errno()));
            }
            while (true) {
                ssize_t rc = ::read(in.get(), buffer.data(), buffer.size());
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    throw FinalizeError(errno_message("read failed for", staged, errno));
                }
                if (rc == 0) {
                    break;
                }
                write_all<FinalizeError>(out.get(), buffer.data(), static_cast<std::size_t>(rc), assembly);
            }
        }
        if (::fsync(out.get()) != 0) {
            throw FinalizeError(errno_message("fsync failed for", assembly, errno));
        }
        if (out.close() != 0) {
            throw FinalizeError(errno_message("failed to close", assembly, errno));
        }
    }
    if (::rename(assembly.c_str(), target_.c_str()) != 0) {
        throw FinalizeError(errno_message("failed to move assembled object onto", target_, errno));
    }
    closed_ = true;

    for (auto part_number : staged_) {
        std::error_code ec;
        std::filesystem::remove(staged_part_path(part_number), ec);
        if (ec) {
            logger_->warn("Failed to delete staged part {}: {}", staged_part_path(part_number).string(),
                          ec.message());
        }
    }
    logger_->debug("{} assembled from {} parts", target_.string(), expected_parts);
    parts_.clear();
    staged_.clear();
}

void LocalFileDestination::abort() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        logger_->warn("abort of {} ignored: upload session already closed", target_.string());
        return;
    }
    closed_ = true;
    try {
        discard_staged_files();
    } catch (const AbortError &e) {
        logger_->warn("Error during abort/cleanup: {}", e.what());
    } catch (const std::exception &e) {
        logger_->warn("Error during abort/cleanup of {}: {}", target_.string(), e.what());
    }
}

void LocalFileDestination::discard_staged_files() {
    std::vector<std::filesystem::path> leftovers;
    std::vector<std::filesystem::path> candidates;
    for (auto part_number : staged_) {
        candidates.push_back(staged_part_path(part_number));
    }
    candidates.push_back(assembly_path());
    for (const auto &path : candidates) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            leftovers.push_back(path);
        }
    }
    logger_->debug("discarded {} staged parts of {}", staged_.size(), target_.string());
    parts_.clear();
    staged_.clear();
    if (!leftovers.empty()) {
        std::ostringstream oss;
        oss << "could not remove " << leftovers.size() << " staged file(s), first: "
            << leftovers.front().string();
        throw AbortError(oss.str());
    }
}

std::string LocalFileDestination::describe() const { return target_.string(); }

} // namespace cloudmover
