#ifndef ETAGCACHE_FINGERPRINT_HPP
#define ETAGCACHE_FINGERPRINT_HPP

#include "common.hpp"

// 16-byte MD5 digest of a cached body
using Digest = std::array<unsigned char, 16>;

class Fingerprint
{
public:
    // digest of a byte sequence, the empty sequence included
    [[nodiscard]] static Digest md5(std::string_view bytes);

    // 32 lowercase hex characters, for log output
    [[nodiscard]] static std::string toHex(const Digest &digest);

private:
    // RAII wrapper for libcrypto's digest context
    struct ContextDeleter
    {
        void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
    };
    using UniqueContext = std::unique_ptr<EVP_MD_CTX, ContextDeleter>;
};

#endif // ETAGCACHE_FINGERPRINT_HPP
