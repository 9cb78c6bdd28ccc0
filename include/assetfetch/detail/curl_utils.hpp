#pragma once

namespace assetfetch::detail {

// Runs curl_global_init exactly once per process; cleanup is registered with atexit.
// Throws ConfigurationError if libcurl cannot be initialised or lacks TLS.
void ensureCurlInitialized();

} // namespace assetfetch::detail
