#include "assetfetch/config.hpp"
#include "assetfetch/curl_transport.hpp"
#include "assetfetch/download_manager.hpp"
#include "assetfetch/errors.hpp"
#include "assetfetch/logging.hpp"
#include "assetfetch/manifest.hpp"
#include "assetfetch/reporter.hpp"

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kExitConfigError = 2;

} // namespace

int main(int argc, char** argv) {
    try {
        // Installed before parsing so option errors are logged to stderr as well.
        assetfetch::installLogger();
        const auto parsed = assetfetch::parseArguments(argc, argv);
        if (parsed.show_help) {
            assetfetch::printUsage(argv[0]);
            return 0;
        }
        const auto& config = parsed.config;
        assetfetch::applyLogLevel(config);

        // Everything that can be misconfigured is checked before the first task starts.
        const assetfetch::Manifest manifest = assetfetch::loadManifest(config);
        assetfetch::prepareDestination(config.destination_dir);

        assetfetch::CurlTransport transport;

        assetfetch::SchedulerOptions options;
        options.pool_size = config.pool_size;
        options.destination_dir = config.destination_dir;
        options.transport.connect_timeout = config.timeout;
        options.transport.read_timeout = config.timeout;
        options.verifier.chunk_size = config.chunk_size;

        assetfetch::DownloadManager manager(manifest, transport, options);
        std::size_t finished = 0;
        manager.setOutcomeCallback([&finished, total = manifest.size()](const assetfetch::DownloadOutcome& outcome) {
            ++finished;
            spdlog::debug("[{}/{}] {} finished: {}", finished, total, outcome.task->local_path,
                          assetfetch::toString(outcome.status));
        });

        spdlog::info("Starting download of {} files to '{}' with {} workers",
                     manifest.size(), config.destination_dir.string(), config.pool_size);
        std::cout << fmt::format("Starting download of {} files to '{}/'...\n",
                                 manifest.size(), config.destination_dir.string())
                  << std::flush;

        const auto summary = manager.run();
        std::cout << '\n';
        assetfetch::printReport(summary, std::cout);
        return assetfetch::exitCodeFor(summary);

    } catch (const assetfetch::ConfigurationError& ex) {
        spdlog::error("Configuration error: {}", ex.what());
        std::cerr << "Run with --help for usage." << std::endl;
        return kExitConfigError;
    } catch (const std::exception& ex) {
        spdlog::critical("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
