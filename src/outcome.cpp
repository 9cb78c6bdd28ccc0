#include "assetfetch/outcome.hpp"

#include <utility>

namespace assetfetch {

const char* toString(OutcomeStatus status) noexcept {
    switch (status) {
        case OutcomeStatus::Success:
            return "Success";
        case OutcomeStatus::NetworkFailure:
            return "NetworkFailure";
        case OutcomeStatus::DigestMismatch:
            return "DigestMismatch";
    }
    return "Unknown";
}

DownloadOutcome makeSuccess(const DownloadTask& task, std::uint64_t bytes_written) {
    return {&task, OutcomeStatus::Success, bytes_written, {}};
}

DownloadOutcome makeFailure(const DownloadTask& task, OutcomeStatus status,
                            std::uint64_t bytes_written, std::string detail) {
    if (detail.empty()) {
        detail = toString(status);
    }
    return {&task, status, bytes_written, std::move(detail)};
}

} // namespace assetfetch
