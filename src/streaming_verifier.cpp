#include "assetfetch/streaming_verifier.hpp"

#include "assetfetch/sha256.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace assetfetch {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

// Flushes and closes explicitly so a failed close counts as a write error.
bool closeFile(FilePtr& file) {
    FILE* raw = file.release();
    return std::fclose(raw) == 0;
}

} // namespace

StreamingVerifier::StreamingVerifier(VerifierOptions options) : options_(options) {
    options_.chunk_size = std::max<std::size_t>(1, options_.chunk_size);
}

DownloadOutcome StreamingVerifier::run(const DownloadTask& task, ByteStream& stream,
                                       const std::filesystem::path& destination_dir) const {
    const std::filesystem::path destination = destination_dir / task.local_path;

    std::error_code ec;
    std::filesystem::create_directories(destination.parent_path(), ec);
    if (ec) {
        return makeFailure(task, OutcomeStatus::NetworkFailure, 0,
                           fmt::format("Cannot create directory {}: {}",
                                       destination.parent_path().string(), ec.message()));
    }

    FilePtr file{std::fopen(destination.string().c_str(), "wb")};
    if (!file) {
        return makeFailure(task, OutcomeStatus::NetworkFailure, 0,
                           fmt::format("Cannot create destination file {}: {}",
                                       destination.string(), std::strerror(errno)));
    }

    Sha256 hasher;
    std::vector<char> chunk(options_.chunk_size);
    std::uint64_t written_total = 0;

    try {
        while (true) {
            const std::size_t got = stream.read(chunk.data(), chunk.size());
            if (got == 0) {
                break;
            }

            const std::size_t written = std::fwrite(chunk.data(), 1, got, file.get());
            written_total += written;
            if (written != got) {
                return makeFailure(task, OutcomeStatus::NetworkFailure, written_total,
                                   fmt::format("Failed to write {}: {}",
                                               destination.string(), std::strerror(errno)));
            }
            hasher.update(chunk.data(), got);
        }
    } catch (const std::exception& ex) {
        // The partially written file stays where it is.
        return makeFailure(task, OutcomeStatus::NetworkFailure, written_total, ex.what());
    } catch (...) {
        return makeFailure(task, OutcomeStatus::NetworkFailure, written_total, "unknown stream error");
    }

    if (!closeFile(file)) {
        return makeFailure(task, OutcomeStatus::NetworkFailure, written_total,
                           fmt::format("Failed to flush {}: {}", destination.string(), std::strerror(errno)));
    }

    const std::string actual = hasher.finalHex();
    spdlog::debug("{}: {} bytes written, sha256 {}", task.local_path, written_total, actual);

    if (!task.expected_digest) {
        return makeSuccess(task, written_total);
    }
    if (!digestsEqual(*task.expected_digest, actual)) {
        return makeFailure(task, OutcomeStatus::DigestMismatch, written_total,
                           fmt::format("checksum mismatch: expected {}, got {}",
                                       *task.expected_digest, actual));
    }
    return makeSuccess(task, written_total);
}

DownloadOutcome StreamingVerifier::fetch(const DownloadTask& task, Transport& transport,
                                         const TransportOptions& transport_options,
                                         const std::filesystem::path& destination_dir) const {
    std::unique_ptr<ByteStream> stream;
    try {
        stream = transport.openStream(task.remote_locator, transport_options);
    } catch (const std::exception& ex) {
        return makeFailure(task, OutcomeStatus::NetworkFailure, 0, ex.what());
    } catch (...) {
        return makeFailure(task, OutcomeStatus::NetworkFailure, 0, "unknown transport error");
    }
    if (!stream) {
        return makeFailure(task, OutcomeStatus::NetworkFailure, 0,
                           fmt::format("No stream returned for {}", task.remote_locator));
    }

    spdlog::debug("{}: stream opened for {}", task.local_path, task.remote_locator);
    return run(task, *stream, destination_dir);
}

} // namespace assetfetch
