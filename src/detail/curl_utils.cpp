#include "assetfetch/detail/curl_utils.hpp"

#include "assetfetch/errors.hpp"

#include <cstdlib>
#include <mutex>

#include <curl/curl.h>
#include <fmt/format.h>

namespace assetfetch::detail {

void ensureCurlInitialized() {
    // call_once re-runs the initialiser on a later call if this attempt throws.
    static std::once_flag flag;
    std::call_once(flag, [] {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            throw ConfigurationError(fmt::format("libcurl initialisation failed: {}", curl_easy_strerror(rc)));
        }

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (info && (info->features & CURL_VERSION_SSL) == 0) {
            curl_global_cleanup();
            throw ConfigurationError(fmt::format("libcurl {} was built without TLS support", info->version));
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

} // namespace assetfetch::detail
