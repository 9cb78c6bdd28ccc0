#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace assetfetch {

struct TransportOptions {
    std::chrono::milliseconds connect_timeout{10000};
    // Longest stall without receiving any bytes before the transfer fails.
    std::chrono::milliseconds read_timeout{10000};
    std::string user_agent{"assetfetch/1.0"};
};

// Sequentially readable body of unknown length.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Returns 0 at end of stream. Throws NetworkFailure if the transfer breaks.
    virtual std::size_t read(char* buffer, std::size_t capacity) = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Throws NetworkFailure when the stream cannot be opened
    // (connection refused, TLS failure, timeout, non-2xx status).
    [[nodiscard]] virtual std::unique_ptr<ByteStream> openStream(const std::string& locator,
                                                                 const TransportOptions& options) = 0;
};

} // namespace assetfetch
