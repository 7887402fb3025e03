#include <wikichunk/crypto/md5_hasher.h>

#include <openssl/evp.h>
#include <fmt/format.h>

#include <array>
#include <stdexcept>

namespace wikichunk::crypto {

struct MD5Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

MD5Hasher::MD5Hasher() : pImpl(std::make_unique<Impl>()) {
    init();
}

MD5Hasher::~MD5Hasher() = default;

MD5Hasher::MD5Hasher(MD5Hasher&&) noexcept = default;
MD5Hasher& MD5Hasher::operator=(MD5Hasher&&) noexcept = default;

void MD5Hasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize MD5");
    }
}

void MD5Hasher::update(std::string_view data) {
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update MD5");
    }
}

std::string MD5Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize MD5");
    }

    std::string result;
    result.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        result += fmt::format("{:02x}", digest[i]);
    }

    // Reset for potential reuse
    init();

    return result;
}

std::string MD5Hasher::hash(std::string_view data) {
    MD5Hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

} // namespace wikichunk::crypto
