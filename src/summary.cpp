#include "assetfetch/summary.hpp"

#include <utility>

namespace assetfetch {

Summary Summary::build(std::vector<DownloadOutcome> outcomes,
                       std::chrono::steady_clock::duration elapsed) {
    Summary summary;
    summary.outcomes = std::move(outcomes);
    summary.elapsed = elapsed;
    for (const auto& outcome : summary.outcomes) {
        if (!outcome.succeeded() && outcome.task) {
            summary.failed_task_names.insert(outcome.task->local_path);
        }
    }
    return summary;
}

} // namespace assetfetch
