#include "assetfetch/manifest.hpp"

#include "assetfetch/errors.hpp"
#include "assetfetch/sha256.hpp"

#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include <fmt/format.h>

namespace assetfetch {

namespace {

bool isHttpUrl(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

// Returns the normalised form used to detect two spellings of one destination.
std::string validateLocalName(const std::string& local) {
    if (local.empty()) {
        throw ConfigurationError("Manifest entry has an empty local filename");
    }
    const std::filesystem::path path{local};
    if (path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
        throw ConfigurationError(fmt::format("Local filename must be relative: {}", local));
    }
    for (const auto& part : path) {
        if (part.string() == "..") {
            throw ConfigurationError(fmt::format("Local filename escapes the destination directory: {}", local));
        }
    }
    const std::filesystem::path normal = path.lexically_normal();
    if (normal.filename().empty() || normal.filename().string() == ".") {
        throw ConfigurationError(fmt::format("Local filename does not name a file: {}", local));
    }
    return normal.generic_string();
}

} // namespace

Manifest::Manifest(const std::vector<ManifestEntry>& entries, const std::string& base_url) {
    std::set<std::string> seen;
    tasks_.reserve(entries.size());

    for (const auto& entry : entries) {
        if (!seen.insert(validateLocalName(entry.local_filename)).second) {
            throw ConfigurationError(fmt::format("Duplicate local filename in manifest: {}", entry.local_filename));
        }
        if (entry.remote_filename.empty()) {
            throw ConfigurationError(fmt::format("Manifest entry {} has an empty remote filename", entry.local_filename));
        }
        if (entry.expected_digest_hex && !isSha256Hex(*entry.expected_digest_hex)) {
            throw ConfigurationError(fmt::format("Manifest entry {} has an invalid SHA-256 digest: {}",
                                                 entry.local_filename,
                                                 *entry.expected_digest_hex));
        }

        tasks_.push_back(DownloadTask{
            entry.local_filename,
            resolveLocator(base_url, entry.remote_filename),
            entry.expected_digest_hex
        });
    }
}

std::string Manifest::resolveLocator(const std::string& base_url, const std::string& remote) {
    if (isHttpUrl(remote) || base_url.empty()) {
        return remote;
    }

    std::string locator = base_url;
    while (!locator.empty() && locator.back() == '/') {
        locator.pop_back();
    }
    std::size_t start = 0;
    while (start < remote.size() && remote[start] == '/') {
        ++start;
    }
    locator.push_back('/');
    locator.append(remote, start, std::string::npos);
    return locator;
}

Manifest Manifest::fromFile(const std::filesystem::path& path, const std::string& base_url) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError(fmt::format("Cannot open manifest file: {}", path.string()));
    }

    std::vector<ManifestEntry> entries;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;

        std::istringstream fields(line);
        std::vector<std::string> parts;
        std::string field;
        while (fields >> field) {
            parts.push_back(std::move(field));
        }
        if (parts.empty() || parts.front().front() == '#') {
            continue;
        }
        if (parts.size() < 2 || parts.size() > 3) {
            throw ConfigurationError(fmt::format("{}:{}: expected '<local> <remote> [<sha256>]'",
                                                 path.string(), line_number));
        }

        ManifestEntry entry{parts[0], parts[1], std::nullopt};
        if (parts.size() == 3) {
            entry.expected_digest_hex = parts[2];
        }
        entries.push_back(std::move(entry));
    }
    if (in.bad()) {
        throw ConfigurationError(fmt::format("Failed to read manifest file: {}", path.string()));
    }

    try {
        return Manifest(entries, base_url);
    } catch (const ConfigurationError& ex) {
        throw ConfigurationError(fmt::format("{}: {}", path.string(), ex.what()));
    }
}

Manifest Manifest::builtin(const std::string& base_url) {
    static const std::vector<ManifestEntry> kTextures = {
        {"sun.jpg", "2k_sun.jpg", std::nullopt},
        {"mercury.jpg", "2k_mercury.jpg", std::nullopt},
        {"venus.jpg", "2k_venus_surface.jpg", std::nullopt},
        {"earth.jpg", "2k_earth_daymap.jpg", std::nullopt},
        {"moon.jpg", "2k_moon.jpg", std::nullopt},
        {"mars.jpg", "2k_mars.jpg", std::nullopt},
        {"jupiter.jpg", "2k_jupiter.jpg", std::nullopt},
        {"saturn.jpg", "2k_saturn.jpg", std::nullopt},
        {"uranus.jpg", "2k_uranus.jpg", std::nullopt},
        {"neptune.jpg", "2k_neptune.jpg", std::nullopt},
        {"stars.jpg", "2k_stars_milky_way.jpg", std::nullopt},
    };
    return Manifest(kTextures, base_url);
}

} // namespace assetfetch
