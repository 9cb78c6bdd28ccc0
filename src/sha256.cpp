#include "assetfetch/sha256.hpp"

#include <array>
#include <cctype>
#include <stdexcept>

#include <openssl/evp.h>

namespace assetfetch {

class Sha256::Impl {
public:
    Impl() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("Failed to initialise SHA-256 context");
        }
    }

    void update(const char* data, std::size_t size) {
        if (finalized_) {
            throw std::logic_error("SHA-256 accumulator already finalised");
        }
        if (size == 0) {
            return;
        }
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    std::string finalHex() {
        if (finalized_) {
            throw std::logic_error("SHA-256 accumulator already finalised");
        }
        std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), hash.data(), &hash_len) != 1) {
            throw std::runtime_error("SHA-256 finalisation failed");
        }
        finalized_ = true;

        static constexpr char kHex[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(static_cast<std::size_t>(hash_len) * 2);
        for (unsigned int i = 0; i < hash_len; ++i) {
            hex.push_back(kHex[hash[i] >> 4]);
            hex.push_back(kHex[hash[i] & 0x0f]);
        }
        return hex;
    }

private:
    using ContextHandle = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    ContextHandle ctx_;
    bool finalized_{false};
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {}

Sha256::~Sha256() = default;

void Sha256::update(const char* data, std::size_t size) { impl_->update(data, size); }

std::string Sha256::finalHex() { return impl_->finalHex(); }

std::string sha256Hex(std::string_view data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalHex();
}

bool digestsEqual(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto lhs = std::tolower(static_cast<unsigned char>(a[i]));
        const auto rhs = std::tolower(static_cast<unsigned char>(b[i]));
        if (lhs != rhs) {
            return false;
        }
    }
    return true;
}

bool isSha256Hex(std::string_view s) noexcept {
    if (s.size() != 64) {
        return false;
    }
    for (const char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace assetfetch
