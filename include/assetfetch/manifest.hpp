#pragma once

#include "download_task.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace assetfetch {

inline constexpr const char* kDefaultBaseUrl = "https://www.solarsystemscope.com/textures/download";

struct ManifestEntry {
    std::string local_filename;
    std::string remote_filename;
    std::optional<std::string> expected_digest_hex;
};

/**
 * Ordered, immutable list of download tasks.
 *
 * Local filenames identify tasks across the whole run, so the constructor
 * rejects duplicates instead of letting a later entry overwrite an earlier one.
 * Throws ConfigurationError on any invalid entry.
 */
class Manifest {
public:
    using const_iterator = std::vector<DownloadTask>::const_iterator;

    Manifest() = default;
    Manifest(const std::vector<ManifestEntry>& entries, const std::string& base_url);

    // One entry per line: <local> <remote> [<sha256>]. '#' starts a comment line.
    [[nodiscard]] static Manifest fromFile(const std::filesystem::path& path, const std::string& base_url);
    [[nodiscard]] static Manifest builtin(const std::string& base_url = kDefaultBaseUrl);

    [[nodiscard]] const std::vector<DownloadTask>& tasks() const noexcept { return tasks_; }
    [[nodiscard]] std::size_t size() const noexcept { return tasks_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tasks_.empty(); }
    [[nodiscard]] const_iterator begin() const noexcept { return tasks_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return tasks_.end(); }

    [[nodiscard]] static std::string resolveLocator(const std::string& base_url, const std::string& remote);

private:
    std::vector<DownloadTask> tasks_;
};

} // namespace assetfetch
