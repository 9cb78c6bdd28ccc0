#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace assetfetch {

// Incremental SHA-256 over OpenSSL EVP.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const char* data, std::size_t size);
    void update(std::string_view data) { update(data.data(), data.size()); }

    // Lower-case hex. The accumulator cannot be updated afterwards.
    [[nodiscard]] std::string finalHex();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

[[nodiscard]] std::string sha256Hex(std::string_view data);

// Case-insensitive comparison of two hex digests.
[[nodiscard]] bool digestsEqual(std::string_view a, std::string_view b) noexcept;

[[nodiscard]] bool isSha256Hex(std::string_view s) noexcept;

} // namespace assetfetch
