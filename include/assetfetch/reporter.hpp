#pragma once

#include "outcome.hpp"
#include "summary.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace assetfetch {

[[nodiscard]] std::string formatOutcomeLine(const DownloadOutcome& outcome);
[[nodiscard]] std::string formatSummaryLine(const Summary& summary);
[[nodiscard]] std::string formatFailureLine(const Summary& summary);
[[nodiscard]] std::string formatSize(std::uint64_t bytes);

// One line per outcome in manifest order, then the totals and the pass/fail line.
void printReport(const Summary& summary, std::ostream& out);

// 0 iff every task succeeded.
[[nodiscard]] int exitCodeFor(const Summary& summary) noexcept;

} // namespace assetfetch
