#pragma once

#include "manifest.hpp"
#include "outcome.hpp"
#include "streaming_verifier.hpp"
#include "summary.hpp"
#include "transport.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace assetfetch {

struct SchedulerOptions {
    std::size_t pool_size{10};
    TransportOptions transport{};
    VerifierOptions verifier{};
    std::filesystem::path destination_dir{"."};
};

using OutcomeCallback = std::function<void(const DownloadOutcome&)>;

/**
 * Runs every manifest task on a fixed pool of worker threads.
 *
 * Workers claim the next unstarted task from a shared atomic counter until
 * none remain, so at most pool_size streams are open at once. run() joins all workers before it
 * builds the Summary; outcomes are stored by manifest index.
 */
class DownloadManager {
public:
    DownloadManager(const Manifest& manifest, Transport& transport, SchedulerOptions options);

    // Invoked from worker threads as each task finishes; calls are serialised.
    void setOutcomeCallback(OutcomeCallback callback);

    [[nodiscard]] Summary run();

private:
    void workerLoop(std::vector<std::optional<DownloadOutcome>>& slots);
    [[nodiscard]] DownloadOutcome executeTask(const DownloadTask& task) const;
    void notifyCompleted(const DownloadOutcome& outcome);

    const Manifest& manifest_;
    Transport& transport_;
    SchedulerOptions options_;
    StreamingVerifier verifier_;
    OutcomeCallback callback_;

    std::mutex callback_mutex_;
    std::atomic<std::size_t> next_index_{0};
};

} // namespace assetfetch
