#include "assetfetch/config.hpp"

#include "assetfetch/errors.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <unistd.h>

namespace assetfetch {

namespace {

constexpr std::size_t kMaxPoolSize = 64;
constexpr long kMaxChunkKiB = 16 * 1024;
constexpr long kMaxTimeoutSeconds = 3600;

long parseLong(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError(fmt::format("Invalid value for {}: {}", option, value));
    }
    if (consumed != value.size()) {
        throw ConfigurationError(fmt::format("Invalid value for {}: {}", option, value));
    }
    return parsed;
}

} // namespace

void printUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Destination directory (default: textures)\n"
              << "  -j <workers>     Concurrent downloads, 1-" << kMaxPoolSize << " (default: 10)\n"
              << "  -m <file>        Manifest file: <local> <remote> [<sha256>] per line\n"
              << "                   (default: built-in texture manifest)\n"
              << "  -b <url>         Base URL for relative remote names\n"
              << "  -T <seconds>     Connect and stall timeout, 1-" << kMaxTimeoutSeconds << " (default: 10)\n"
              << "  -c <KiB>         Read chunk size, 1-" << kMaxChunkKiB << " (default: 64)\n"
              << "  -v               Debug logging\n"
              << "  -q               Only log warnings and errors\n"
              << "  -h, --help       Show this message" << std::endl;
}

ParseResult parseArguments(int argc, const char* const* argv) {
    ParseResult result;
    RunConfig& config = result.config;
    int arg_index = 1;

    auto requireValue = [&](const std::string& option) -> std::string {
        if (arg_index + 1 >= argc) {
            throw ConfigurationError(fmt::format("Option {} requires a value", option));
        }
        return argv[arg_index + 1];
    };

    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            result.show_help = true;
            return result;
        } else if (option == "-v") {
            config.verbose = true;
            ++arg_index;
        } else if (option == "-q") {
            config.quiet = true;
            ++arg_index;
        } else if (option == "-d") {
            config.destination_dir = requireValue(option);
            if (config.destination_dir.empty()) {
                throw ConfigurationError("Destination directory must not be empty");
            }
            arg_index += 2;
        } else if (option == "-j") {
            const long workers = parseLong(option, requireValue(option));
            if (workers <= 0 || workers > static_cast<long>(kMaxPoolSize)) {
                throw ConfigurationError(fmt::format("Worker count must be between 1 and {}", kMaxPoolSize));
            }
            config.pool_size = static_cast<std::size_t>(workers);
            arg_index += 2;
        } else if (option == "-m") {
            config.manifest_path = std::filesystem::path{requireValue(option)};
            arg_index += 2;
        } else if (option == "-b") {
            config.base_url = requireValue(option);
            arg_index += 2;
        } else if (option == "-T") {
            const long seconds = parseLong(option, requireValue(option));
            if (seconds <= 0 || seconds > kMaxTimeoutSeconds) {
                throw ConfigurationError(fmt::format("Timeout must be between 1 and {} seconds", kMaxTimeoutSeconds));
            }
            config.timeout = std::chrono::seconds{seconds};
            arg_index += 2;
        } else if (option == "-c") {
            const long kib = parseLong(option, requireValue(option));
            if (kib <= 0 || kib > kMaxChunkKiB) {
                throw ConfigurationError(fmt::format("Chunk size must be between 1 and {} KiB", kMaxChunkKiB));
            }
            config.chunk_size = static_cast<std::size_t>(kib) * 1024;
            arg_index += 2;
        } else {
            throw ConfigurationError(fmt::format("Unknown option: {}", option));
        }
    }

    if (config.verbose && config.quiet) {
        throw ConfigurationError("Options -v and -q are mutually exclusive");
    }
    return result;
}

void prepareDestination(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw ConfigurationError(fmt::format("Failed to create download directory: {} - {}",
                                             dir.string(), ec.message()));
    }
    if (!std::filesystem::is_directory(dir, ec)) {
        throw ConfigurationError(fmt::format("Destination is not a directory: {}", dir.string()));
    }
    if (::access(dir.c_str(), W_OK | X_OK) != 0) {
        throw ConfigurationError(fmt::format("Destination directory is not writable: {}", dir.string()));
    }
}

Manifest loadManifest(const RunConfig& config) {
    if (config.manifest_path) {
        return Manifest::fromFile(*config.manifest_path, config.base_url);
    }
    return Manifest::builtin(config.base_url);
}

} // namespace assetfetch
