#include "assetfetch/reporter.hpp"

#include <chrono>
#include <string>

#include <fmt/format.h>

namespace assetfetch {

namespace {

std::string displayName(const DownloadOutcome& outcome) {
    if (!outcome.task || outcome.task->local_path.empty()) {
        return "(unnamed)";
    }
    return outcome.task->local_path;
}

std::string joinNames(const std::set<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined.append(", ");
        }
        joined.append(name);
    }
    return joined;
}

} // namespace

std::string formatOutcomeLine(const DownloadOutcome& outcome) {
    const auto name = displayName(outcome);
    if (outcome.succeeded()) {
        return fmt::format("  - {}... ✅ Done ({})", name, formatSize(outcome.bytes_written));
    }
    return fmt::format("  - {}... ❌ {}: {}", name, toString(outcome.status), outcome.error_detail);
}

std::string formatSummaryLine(const Summary& summary) {
    const double seconds = std::chrono::duration<double>(summary.elapsed).count();
    return fmt::format("⏱️  {} succeeded, {} failed of {} in {:.2f}s",
                       summary.succeededCount(),
                       summary.failedCount(),
                       summary.outcomes.size(),
                       seconds);
}

std::string formatFailureLine(const Summary& summary) {
    if (summary.allSucceeded()) {
        return "✨ PASS: all downloads completed successfully.";
    }
    return fmt::format("⚠️  FAIL: the following downloads failed: {}", joinNames(summary.failed_task_names));
}

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

void printReport(const Summary& summary, std::ostream& out) {
    std::string report;
    report.reserve(summary.outcomes.size() * 96 + 256);
    for (const auto& outcome : summary.outcomes) {
        report += formatOutcomeLine(outcome);
        report.push_back('\n');
    }
    report.push_back('\n');
    report += formatSummaryLine(summary);
    report.push_back('\n');
    report += formatFailureLine(summary);
    report.push_back('\n');

    out << report << std::flush;
}

int exitCodeFor(const Summary& summary) noexcept {
    return summary.allSucceeded() ? 0 : 1;
}

} // namespace assetfetch
