#include "fingerprint.hpp"

Digest Fingerprint::md5(std::string_view bytes)
{
    UniqueContext ctx(EVP_MD_CTX_new());
    if (!ctx)
    {
        throw std::bad_alloc();
    }

    Digest digest{};
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 ||
        length != digest.size())
    {
        throw std::runtime_error("MD5 digest failed: " +
                                 std::string(ERR_error_string(ERR_get_error(), nullptr)));
    }
    return digest;
}

std::string Fingerprint::toHex(const Digest &digest)
{
    static constexpr char hexDigits[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(digest.size() * 2);
    for (unsigned char byte : digest)
    {
        hex.push_back(hexDigits[byte >> 4]);
        hex.push_back(hexDigits[byte & 0x0f]);
    }
    return hex;
}
