#pragma once

#include "config.hpp"

#include <memory>

#include <spdlog/logger.h>

namespace assetfetch {

// Installs the "assetfetch" stderr logger as spdlog's default. Safe to call more than once.
std::shared_ptr<spdlog::logger> installLogger();

void applyLogLevel(const RunConfig& config);

} // namespace assetfetch
