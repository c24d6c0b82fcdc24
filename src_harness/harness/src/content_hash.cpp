#include "patchgrade_harness/content_hash.hpp"

#include <array>
#include <stdexcept>
#include <string>

#include <openssl/evp.h>

namespace patchgrade::harness {

struct ContentHasher::Context {
    EVP_MD_CTX* md{nullptr};

    Context() : md{EVP_MD_CTX_new()} {}
    ~Context() { EVP_MD_CTX_free(md); }
};

ContentHasher::ContentHasher() : ctx_{std::make_unique<Context>()} {
    if (ctx_->md == nullptr || EVP_DigestInit_ex(ctx_->md, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Unable to initialise SHA-256 context");
    }
}

ContentHasher::~ContentHasher() = default;

ContentHasher& ContentHasher::field(std::string_view bytes) {
    if (finished_) {
        throw std::logic_error("ContentHasher::field() after hex_digest()");
    }
    const auto prefix = std::to_string(bytes.size()) + ":";
    if (EVP_DigestUpdate(ctx_->md, prefix.data(), prefix.size()) != 1 ||
        EVP_DigestUpdate(ctx_->md, bytes.data(), bytes.size()) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
    return *this;
}

std::string ContentHasher::hex_digest() {
    if (finished_) {
        throw std::logic_error("ContentHasher::hex_digest() called twice");
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_->md, digest.data(), &length) != 1) {
        throw std::runtime_error("SHA-256 finalisation failed");
    }
    finished_ = true;

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0F]);
    }
    return out;
}

}  // namespace patchgrade::harness
