#pragma once

#include "manifest.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace assetfetch {

struct RunConfig {
    std::filesystem::path destination_dir{"textures"};
    std::size_t pool_size{10};
    std::chrono::milliseconds timeout{10000};
    std::size_t chunk_size{64 * 1024};
    std::string base_url{kDefaultBaseUrl};
    std::optional<std::filesystem::path> manifest_path;
    bool verbose{false};
    bool quiet{false};
};

struct ParseResult {
    RunConfig config;
    bool show_help{false};
};

// Throws ConfigurationError on unknown options or invalid values.
[[nodiscard]] ParseResult parseArguments(int argc, const char* const* argv);

void printUsage(const char* program_name);

// Creates the directory if needed and checks it is writable.
void prepareDestination(const std::filesystem::path& dir);

[[nodiscard]] Manifest loadManifest(const RunConfig& config);

} // namespace assetfetch
