#pragma once

#include "download_task.hpp"

#include <cstdint>
#include <string>

namespace assetfetch {

enum class OutcomeStatus {
    Success,
    NetworkFailure,
    DigestMismatch,
};

[[nodiscard]] const char* toString(OutcomeStatus status) noexcept;

struct DownloadOutcome {
    const DownloadTask* task{nullptr};
    OutcomeStatus status{OutcomeStatus::Success};
    std::uint64_t bytes_written{0};
    std::string error_detail; // empty iff status == Success

    [[nodiscard]] bool succeeded() const noexcept { return status == OutcomeStatus::Success; }
};

[[nodiscard]] DownloadOutcome makeSuccess(const DownloadTask& task, std::uint64_t bytes_written);
[[nodiscard]] DownloadOutcome makeFailure(const DownloadTask& task, OutcomeStatus status,
                                          std::uint64_t bytes_written, std::string detail);

} // namespace assetfetch
