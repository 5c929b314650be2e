#ifndef ETAGCACHE_COMPRESSION_HPP
#define ETAGCACHE_COMPRESSION_HPP

#include "common.hpp"
#include "errors.hpp"
#include "logger.hpp"

// Decodes Content-Encoding of response bodies before they reach the cache
class Compression
{
public:
    // Check if a Content-Encoding value is one we can decode
    [[nodiscard]]
    static bool canDecode(std::string_view contentEncoding);

    // Decode gzip or deflate data, throws TransportError on corrupt input
    [[nodiscard]]
    static std::string decompress(const std::string &data, std::string_view contentEncoding);

    // Value sent in Accept-Encoding
    static constexpr std::string_view ACCEPT_ENCODING = "gzip, deflate";

private:
    // Decode data using zlib with the given window bits
    [[nodiscard]]
    static std::string inflateData(const std::string &data, int windowBits);

    // RAII wrapper for an inflate stream
    class InflateGuard;

    // Buffer size for decompression (32KB)
    static constexpr size_t DECOMPRESSION_BUFFER_SIZE = 32768;
};

#endif // ETAGCACHE_COMPRESSION_HPP
