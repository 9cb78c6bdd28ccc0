#pragma once

#include <optional>
#include <string>

namespace assetfetch {

struct DownloadTask {
    std::string local_path;
    std::string remote_locator;
    // Hex SHA-256. Absent means the content is not verified.
    std::optional<std::string> expected_digest;
};

} // namespace assetfetch
