#pragma once

#include "transport.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace assetfetch {

class CurlTransport final : public Transport {
public:
    // Above max_buffered_bytes of unread body the transfer is paused until the reader catches up.
    static constexpr std::size_t kDefaultMaxBufferedBytes = 256 * 1024;

    explicit CurlTransport(std::size_t max_buffered_bytes = kDefaultMaxBufferedBytes);
    ~CurlTransport() override;

    [[nodiscard]] std::unique_ptr<ByteStream> openStream(const std::string& locator,
                                                         const TransportOptions& options) override;

private:
    std::size_t max_buffered_bytes_;
};

} // namespace assetfetch
