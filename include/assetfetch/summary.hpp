#pragma once

#include "outcome.hpp"

#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace assetfetch {

struct Summary {
    std::vector<DownloadOutcome> outcomes; // manifest order
    std::set<std::string> failed_task_names;
    std::chrono::steady_clock::duration elapsed{};

    [[nodiscard]] static Summary build(std::vector<DownloadOutcome> outcomes,
                                       std::chrono::steady_clock::duration elapsed);

    [[nodiscard]] std::size_t succeededCount() const noexcept {
        return outcomes.size() - failed_task_names.size();
    }
    [[nodiscard]] std::size_t failedCount() const noexcept { return failed_task_names.size(); }
    [[nodiscard]] bool allSucceeded() const noexcept { return failed_task_names.empty(); }
};

} // namespace assetfetch
