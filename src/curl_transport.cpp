#include "assetfetch/curl_transport.hpp"

#include "assetfetch/detail/curl_utils.hpp"
#include "assetfetch/errors.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>

#include <curl/curl.h>
#include <fmt/format.h>

namespace assetfetch {

namespace {

constexpr int kPollIntervalMs = 1000;

class CurlStream final : public ByteStream {
public:
    CurlStream(const std::string& locator, const TransportOptions& options, std::size_t max_buffered_bytes)
        : locator_(locator),
          max_buffered_bytes_(std::max<std::size_t>(1, max_buffered_bytes)),
          easy_(curl_easy_init(), &curl_easy_cleanup),
          multi_(curl_multi_init(), &curl_multi_cleanup) {
        if (!easy_ || !multi_) {
            throw NetworkFailure("Failed to allocate curl handle");
        }

        const auto stall_seconds = std::max<long>(
            1, static_cast<long>(std::chrono::ceil<std::chrono::seconds>(options.read_timeout).count()));

        curl_easy_setopt(easy_.get(), CURLOPT_URL, locator_.c_str());
        curl_easy_setopt(easy_.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(easy_.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(easy_.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(easy_.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(easy_.get(), CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(easy_.get(), CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(easy_.get(), CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options.connect_timeout.count()));
        curl_easy_setopt(easy_.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(easy_.get(), CURLOPT_LOW_SPEED_TIME, stall_seconds);
        if (!options.user_agent.empty()) {
            curl_easy_setopt(easy_.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
        }
        curl_easy_setopt(easy_.get(), CURLOPT_ERRORBUFFER, error_buffer_.data());
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEFUNCTION, &CurlStream::writeCallback);
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEDATA, this);

        if (curl_multi_add_handle(multi_.get(), easy_.get()) != CURLM_OK) {
            throw NetworkFailure("Failed to register curl transfer");
        }
        attached_ = true;
    }

    ~CurlStream() override {
        if (attached_) {
            curl_multi_remove_handle(multi_.get(), easy_.get());
        }
    }

    // Drives the transfer until the first body bytes arrive or it ends, so
    // connection and HTTP status errors surface before any file is created.
    // Bytes already received are handed to read() first, even if the
    // transfer broke afterwards.
    void prime() {
        pump();
        if (buffer_.size() == offset_) {
            throwIfFailed();
        }
    }

    std::size_t read(char* buffer, std::size_t capacity) override {
        if (capacity == 0) {
            return 0;
        }

        pump();
        const std::size_t available = buffer_.size() - offset_;
        if (available == 0) {
            throwIfFailed();
            return 0;
        }

        const std::size_t n = std::min(capacity, available);
        std::memcpy(buffer, buffer_.data() + offset_, n);
        offset_ += n;
        if (offset_ == buffer_.size()) {
            buffer_.clear();
            offset_ = 0;
            resume();
        }
        return n;
    }

private:
    using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
    using MultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlStream*>(userdata);
        const size_t total = size * nmemb;
        if (!self) {
            return 0;
        }
        if (self->buffer_.size() - self->offset_ >= self->max_buffered_bytes_) {
            self->paused_ = true;
            return CURL_WRITEFUNC_PAUSE;
        }
        self->buffer_.append(ptr, total);
        return total;
    }

    void pump() {
        while (buffer_.size() == offset_ && !done_) {
            int running = 0;
            const CURLMcode mc = curl_multi_perform(multi_.get(), &running);
            if (mc != CURLM_OK) {
                throw NetworkFailure(fmt::format("{}: {}", locator_, curl_multi_strerror(mc)));
            }
            collectMessages();
            if (buffer_.size() != offset_ || done_) {
                break;
            }
            if (curl_multi_wait(multi_.get(), nullptr, 0, kPollIntervalMs, nullptr) != CURLM_OK) {
                throw NetworkFailure(fmt::format("{}: curl wait failed", locator_));
            }
        }
    }

    void collectMessages() {
        int remaining = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi_.get(), &remaining)) {
            if (msg->msg == CURLMSG_DONE && msg->easy_handle == easy_.get()) {
                done_ = true;
                result_ = msg->data.result;
            }
        }
    }

    void resume() {
        if (!paused_) {
            return;
        }
        paused_ = false;
        const CURLcode rc = curl_easy_pause(easy_.get(), CURLPAUSE_CONT);
        if (rc != CURLE_OK) {
            throw NetworkFailure(fmt::format("{}: {}", locator_, curl_easy_strerror(rc)));
        }
    }

    void throwIfFailed() const {
        if (!done_ || result_ == CURLE_OK) {
            return;
        }

        std::string detail = error_buffer_[0] != '\0' ? std::string(error_buffer_.data())
                                                       : std::string(curl_easy_strerror(result_));
        if (result_ == CURLE_HTTP_RETURNED_ERROR) {
            long code = 0;
            curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &code);
            detail = fmt::format("HTTP {}", code);
        }
        throw NetworkFailure(fmt::format("curl error: {} ({})", detail, locator_));
    }

    std::string locator_;
    std::size_t max_buffered_bytes_;
    EasyHandle easy_;
    MultiHandle multi_;
    bool attached_{false};

    std::array<char, CURL_ERROR_SIZE> error_buffer_{};
    std::string buffer_;
    std::size_t offset_{0};
    bool paused_{false};
    bool done_{false};
    CURLcode result_{CURLE_OK};
};

} // namespace

CurlTransport::CurlTransport(std::size_t max_buffered_bytes)
    : max_buffered_bytes_(max_buffered_bytes) {
    detail::ensureCurlInitialized();
}

CurlTransport::~CurlTransport() = default;

std::unique_ptr<ByteStream> CurlTransport::openStream(const std::string& locator,
                                                      const TransportOptions& options) {
    auto stream = std::make_unique<CurlStream>(locator, options, max_buffered_bytes_);
    stream->prime();
    return stream;
}

} // namespace assetfetch
