#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace wikichunk::crypto {

// MD5 digest over OpenSSL EVP. Used for identifiers, not for integrity or security.
class MD5Hasher {
public:
    MD5Hasher();
    ~MD5Hasher();

    // Disable copy, enable move
    MD5Hasher(const MD5Hasher&) = delete;
    MD5Hasher& operator=(const MD5Hasher&) = delete;
    MD5Hasher(MD5Hasher&&) noexcept;
    MD5Hasher& operator=(MD5Hasher&&) noexcept;

    void init();
    void update(std::string_view data);
    // Lowercase hex digest; the hasher is re-initialized afterwards
    std::string finalize();

    // Static utility for one-shot hashing
    static std::string hash(std::string_view data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace wikichunk::crypto
