#pragma once

#include <spdlog/logger.h>

#include <memory>
#include <ostream>
#include <string>

namespace cloudmover {

using Logger = std::shared_ptr<spdlog::logger>;

// stderr logger at info level, or debug when verbose.
Logger make_console_logger(const std::string &name, bool verbose);

// Writes plain "[level] message" lines to `out`; used to capture output in tests.
Logger make_stream_logger(const std::string &name, std::ostream &out);

// Discards everything.
Logger make_null_logger();

} // namespace cloudmover
