#include "assetfetch/download_manager.hpp"

#include "assetfetch/errors.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace assetfetch {

DownloadManager::DownloadManager(const Manifest& manifest, Transport& transport, SchedulerOptions options)
    : manifest_(manifest),
      transport_(transport),
      options_(std::move(options)),
      verifier_(options_.verifier) {
    if (options_.pool_size == 0) {
        throw ConfigurationError("Worker pool size must be at least 1");
    }
}

void DownloadManager::setOutcomeCallback(OutcomeCallback callback) {
    callback_ = std::move(callback);
}

Summary DownloadManager::run() {
    const auto started = std::chrono::steady_clock::now();
    const std::size_t task_count = manifest_.size();

    next_index_.store(0);

    std::vector<std::optional<DownloadOutcome>> slots(task_count);
    const std::size_t worker_count = std::min(options_.pool_size, task_count);

    std::vector<std::thread> threads;
    threads.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        try {
            threads.emplace_back([this, &slots]() { workerLoop(slots); });
        } catch (const std::system_error& ex) {
            // Workers already running drain the queue.
            spdlog::warn("Started {} of {} workers: {}", threads.size(), worker_count, ex.what());
            break;
        }
    }
    if (threads.empty() && task_count > 0) {
        workerLoop(slots);
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads.clear();

    std::vector<DownloadOutcome> outcomes;
    outcomes.reserve(task_count);
    for (std::size_t i = 0; i < task_count; ++i) {
        const auto& task = manifest_.tasks()[i];
        if (slots[i]) {
            outcomes.push_back(std::move(*slots[i]));
        } else {
            outcomes.push_back(makeFailure(task, OutcomeStatus::NetworkFailure, 0, "task was never executed"));
        }
    }

    return Summary::build(std::move(outcomes), std::chrono::steady_clock::now() - started);
}

void DownloadManager::workerLoop(std::vector<std::optional<DownloadOutcome>>& slots) {
    std::size_t handled = 0;
    spdlog::debug("worker started");
    while (true) {
        const std::size_t index = next_index_.fetch_add(1);
        if (index >= slots.size()) {
            break;
        }
        ++handled;

        const auto& task = manifest_.tasks()[index];
        DownloadOutcome outcome = executeTask(task);
        if (!outcome.succeeded()) {
            spdlog::warn("{}: {}: {}", task.local_path, toString(outcome.status), outcome.error_detail);
        }

        notifyCompleted(outcome);
        // Each slot is written by exactly one worker and read only after join().
        slots[index] = std::move(outcome);
    }
    spdlog::debug("worker stopped after {} tasks", handled);
}

DownloadOutcome DownloadManager::executeTask(const DownloadTask& task) const {
    try {
        return verifier_.fetch(task, transport_, options_.transport, options_.destination_dir);
    } catch (const std::exception& ex) {
        return makeFailure(task, OutcomeStatus::NetworkFailure, 0, ex.what());
    } catch (...) {
        return makeFailure(task, OutcomeStatus::NetworkFailure, 0, "unknown error");
    }
}

void DownloadManager::notifyCompleted(const DownloadOutcome& outcome) {
    if (!callback_) {
        return;
    }
    std::lock_guard<std::mutex> lock(callback_mutex_);
    try {
        callback_(outcome);
    } catch (const std::exception& ex) {
        spdlog::error("Outcome callback failed for {}: {}", outcome.task->local_path, ex.what());
    } catch (...) {
        spdlog::error("Outcome callback failed for {}: unknown error", outcome.task->local_path);
    }
}

} // namespace assetfetch
