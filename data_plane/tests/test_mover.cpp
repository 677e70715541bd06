#include "cloudmover/backend_registry.hpp"
#include "cloudmover/errors.hpp"
#include "cloudmover/logging.hpp"
#include "cloudmover/memory_storage.hpp"
#include "cloudmover/mover.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

std::vector<char> make_data(std::size_t size) {
    std::vector<char> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 7) & 0xFF);
    }
    return data;
}

std::vector<char> read_file(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void no_sleep(std::chrono::milliseconds) {}

cloudmover::TransferRequest request_for(const std::string &source, const std::string &destination) {
    cloudmover::TransferRequest request;
    request.source = source;
    request.destination = destination;
    request.max_part_size = 1024;
    request.concurrency = 4;
    request.progress = false;
    return request;
}

// Counts how many times the registry was asked for a destination.
struct OpenCounter {
    int opened = 0;
};

} // namespace

int main() {
    auto logger = cloudmover::make_null_logger();
    auto store = std::make_shared<cloudmover::MemoryObjectStore>();
    auto registry = cloudmover::BackendRegistry::with_builtin_backends(store);
    assert(registry.has_source("file") && registry.has_destination("file"));
    assert(registry.has_source("mem") && registry.has_destination("mem"));
    assert(!registry.has_source("s3"));

    // mem -> mem
    const auto data = make_data(10 * 1024 + 17);
    store->put("bucket/in", data);
    auto report = cloudmover::transfer(request_for("mem://bucket/in", "mem://bucket/out"), registry, logger,
                                       nullptr, cloudmover::RetryPolicy(), no_sleep);
    assert(report.parts == 11);
    assert(report.concurrency == 4);
    assert(report.source_deleted);
    assert(!store->contains("bucket/in"));
    assert(store->get("bucket/out") == data);

    // mem -> file -> mem
    auto temp_dir = fs::temp_directory_path() / "cloudmover_mover_test";
    fs::remove_all(temp_dir);
    auto file_path = temp_dir / "sub" / "moved.bin";
    cloudmover::transfer(request_for("mem://bucket/out", file_path.string()), registry, logger, nullptr,
                         cloudmover::RetryPolicy(), no_sleep);
    assert(read_file(file_path) == data);
    assert(!store->contains("bucket/out"));
    cloudmover::transfer(request_for("file://" + file_path.string(), "mem://bucket/back"), registry, logger,
                         nullptr, cloudmover::RetryPolicy(), no_sleep);
    assert(!fs::exists(file_path));
    assert(store->get("bucket/back") == data);

    // Zero-length objects move too.
    store->put("bucket/empty", {});
    auto empty_report = cloudmover::transfer(request_for("mem://bucket/empty", "mem://bucket/empty-copy"),
                                             registry, logger);
    assert(empty_report.parts == 0);
    assert(!store->contains("bucket/empty"));
    assert(store->contains("bucket/empty-copy"));
    assert(store->get("bucket/empty-copy")->empty());

    // Providers without an adapter fail before anything is touched.
    bool threw = false;
    try {
        cloudmover::transfer(request_for("mem://bucket/back", "s3://bucket/key"), registry, logger);
    } catch (const cloudmover::LocatorError &e) {
        threw = true;
        assert(std::string(e.what()).find("s3") != std::string::npos);
    }
    assert(threw);
    assert(store->contains("bucket/back"));

    threw = false;
    try {
        cloudmover::transfer(request_for("ftp://host/file", "mem://bucket/x"), registry, logger);
    } catch (const cloudmover::LocatorError &) {
        threw = true;
    }
    assert(threw);

    // A missing source never opens the destination.
    OpenCounter counter;
    auto counting = cloudmover::BackendRegistry::with_builtin_backends(store);
    counting.register_destination("mem", [&counter, store](const cloudmover::Locator &locator,
                                                           const cloudmover::Logger &log) {
        ++counter.opened;
        return std::make_unique<cloudmover::MemoryDestination>(store, locator.container + "/" + locator.key,
                                                               log);
    });
    threw = false;
    try {
        cloudmover::transfer(request_for("mem://bucket/nothing", "mem://bucket/y"), counting, logger);
    } catch (const cloudmover::NotFoundError &) {
        threw = true;
    }
    assert(threw);
    assert(counter.opened == 0);
    assert(!store->contains("bucket/y"));

    // Moving an object onto itself would delete the only copy.
    threw = false;
    try {
        cloudmover::transfer(request_for("mem://bucket/back", "mem://bucket/back"), registry, logger);
    } catch (const cloudmover::LocatorError &) {
        threw = true;
    }
    assert(threw);
    assert(store->get("bucket/back") == data);

    auto self_path = temp_dir / "self.bin";
    fs::create_directories(temp_dir);
    {
        std::ofstream out(self_path, std::ios::binary);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
    }
    threw = false;
    try {
        cloudmover::transfer(request_for(self_path.string(), "file://" + self_path.string()), registry, logger);
    } catch (const cloudmover::LocatorError &) {
        threw = true;
    }
    assert(threw);
    assert(read_file(self_path) == data);

    // Bad settings are rejected up front.
    auto bad = request_for("mem://bucket/back", "mem://bucket/z");
    bad.concurrency = 0;
    threw = false;
    try {
        cloudmover::transfer(bad, registry, logger);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    assert(store->contains("bucket/back"));

    fs::remove_all(temp_dir);
    return 0;
}
