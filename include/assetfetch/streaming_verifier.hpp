#pragma once

#include "download_task.hpp"
#include "outcome.hpp"
#include "transport.hpp"

#include <cstddef>
#include <filesystem>

namespace assetfetch {

struct VerifierOptions {
    std::size_t chunk_size{64 * 1024};
};

/**
 * Persists a byte stream to <destination_dir>/<task.local_path> while hashing it.
 *
 * Every failure is turned into a DownloadOutcome; nothing is thrown past run()
 * or fetch(). Partial and mismatching files are left on disk.
 */
class StreamingVerifier {
public:
    explicit StreamingVerifier(VerifierOptions options = {});

    [[nodiscard]] DownloadOutcome run(const DownloadTask& task, ByteStream& stream,
                                      const std::filesystem::path& destination_dir) const;

    // Opens the stream through the transport, then run(). Open failures become NetworkFailure.
    [[nodiscard]] DownloadOutcome fetch(const DownloadTask& task, Transport& transport,
                                        const TransportOptions& transport_options,
                                        const std::filesystem::path& destination_dir) const;

    [[nodiscard]] const VerifierOptions& options() const noexcept { return options_; }

private:
    VerifierOptions options_;
};

} // namespace assetfetch
