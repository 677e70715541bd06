#include "cloudmover/errors.hpp"
#include "cloudmover/local_storage.hpp"
#include "cloudmover/logging.hpp"

#include <sys/resource.h>

#include <cassert>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

std::vector<char> read_file(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<char>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void write_file(const fs::path &path, const std::vector<char> &data) {
    std::ofstream file(path, std::ios::binary);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

std::vector<char> bytes(const std::string &text) { return std::vector<char>(text.begin(), text.end()); }

std::size_t count_entries(const fs::path &dir) {
    std::size_t count = 0;
    for (auto const &entry : fs::directory_iterator(dir)) {
        (void)entry;
        ++count;
    }
    return count;
}

} // namespace

int main() {
    auto temp_dir = fs::temp_directory_path() / "cloudmover_local_storage_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);
    auto logger = cloudmover::make_null_logger();

    auto source_path = temp_dir / "source.bin";
    std::vector<char> data(4096);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<char>(i % 253);
    }
    write_file(source_path, data);

    cloudmover::LocalFileSource source(source_path);
    assert(source.size() == 4096);
    assert(source.read_range(0, 4096) == data);
    auto middle = source.read_range(1000, 24);
    assert(middle == std::vector<char>(data.begin() + 1000, data.begin() + 1024));
    assert(source.read_range(4000, 500).size() == 96);
    assert(source.read_range(5000, 10).empty());

    bool threw = false;
    try {
        cloudmover::LocalFileSource missing(temp_dir / "missing.bin");
        missing.size();
    } catch (const cloudmover::NotFoundError &) {
        threw = true;
    }
    assert(threw);

    // Parts are staged, overwritten on re-upload, and assembled in order.
    auto target = temp_dir / "nested" / "target.bin";
    {
        cloudmover::LocalFileDestination destination(target, logger);
        destination.upload_part(2, bytes("world"));
        destination.upload_part(1, bytes("stale"));
        destination.upload_part(1, bytes("hello "));
        assert(fs::exists(destination.staged_part_path(1)));
        assert(!fs::exists(target));
        destination.finalize(2);
        assert(read_file(target) == bytes("hello world"));
        assert(!fs::exists(destination.staged_part_path(1)));
        assert(!fs::exists(destination.staged_part_path(2)));
        assert(count_entries(target.parent_path()) == 1);
        // abort after finalize leaves the object in place
        destination.abort();
        assert(fs::exists(target));
    }

    // A missing part is refused and abort removes everything staged.
    auto aborted_target = temp_dir / "aborted.bin";
    {
        cloudmover::LocalFileDestination destination(aborted_target, logger);
        destination.upload_part(1, bytes("one"));
        destination.upload_part(3, bytes("three"));
        threw = false;
        try {
            destination.finalize(3);
        } catch (const cloudmover::FinalizeError &) {
            threw = true;
        }
        assert(threw);
        destination.abort();
        assert(!fs::exists(destination.staged_part_path(1)));
        assert(!fs::exists(destination.staged_part_path(3)));
        assert(!fs::exists(aborted_target));
    }

    // A part whose write fails part-way leaves nothing behind after abort.
    auto limited_dir = temp_dir / "limited";
    fs::create_directories(limited_dir);
    {
        cloudmover::LocalFileDestination destination(limited_dir / "big.bin", logger);
        destination.upload_part(1, std::vector<char>(100, 'a'));

        struct rlimit saved;
        assert(::getrlimit(RLIMIT_FSIZE, &saved) == 0);
        auto previous_handler = std::signal(SIGXFSZ, SIG_IGN);
        struct rlimit limited = saved;
        limited.rlim_cur = 1000;
        assert(::setrlimit(RLIMIT_FSIZE, &limited) == 0);
        threw = false;
        try {
            destination.upload_part(2, std::vector<char>(4000, 'b'));
        } catch (const cloudmover::TransientIOError &) {
            threw = true;
        }
        assert(::setrlimit(RLIMIT_FSIZE, &saved) == 0);
        std::signal(SIGXFSZ, previous_handler);
        assert(threw);
        assert(!fs::exists(destination.staged_part_path(2)));

        destination.abort();
        assert(count_entries(limited_dir) == 0);
    }

    // Zero parts produce an empty file.
    auto empty_target = temp_dir / "empty.bin";
    {
        cloudmover::LocalFileDestination destination(empty_target, logger);
        destination.finalize(0);
        assert(fs::exists(empty_target));
        assert(fs::file_size(empty_target) == 0);
    }

    source.remove();
    assert(!fs::exists(source_path));
    threw = false;
    try {
        source.remove();
    } catch (const cloudmover::NotFoundError &) {
        threw = true;
    }
    assert(threw);

    // Sessions do not share staging names.
    cloudmover::LocalFileDestination first(temp_dir / "same.bin", logger);
    cloudmover::LocalFileDestination second(temp_dir / "same.bin", logger);
    assert(first.staged_part_path(1) != second.staged_part_path(1));
    first.abort();
    second.abort();

    fs::remove_all(temp_dir);
    return 0;
}
