#include "assetfetch/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace assetfetch {

namespace {

constexpr const char* kLoggerName = "assetfetch";

} // namespace

std::shared_ptr<spdlog::logger> installLogger() {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kLoggerName);
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    spdlog::set_default_logger(logger);
    return logger;
}

void applyLogLevel(const RunConfig& config) {
    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (config.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

} // namespace assetfetch
