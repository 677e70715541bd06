#include "cloudmover/logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cloudmover {

Logger make_console_logger(const std::string &name, bool verbose) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern("%^%l%$: %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    return logger;
}

Logger make_stream_logger(const std::string &name, std::ostream &out) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out, true);
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_pattern("[%l] %v");
    logger->set_level(spdlog::level::trace);
    return logger;
}

Logger make_null_logger() {
    return std::make_shared<spdlog::logger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace cloudmover
