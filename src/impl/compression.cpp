#include "compression.hpp"

class Compression::InflateGuard
{
    z_stream &zs;

public:
    explicit InflateGuard(z_stream &s) : zs(s) {}
    ~InflateGuard() { inflateEnd(&zs); }
};

namespace
{
    std::string lowercase(std::string_view value)
    {
        std::string result(value);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return result;
    }
}

bool Compression::canDecode(std::string_view contentEncoding)
{
    const std::string encoding = lowercase(contentEncoding);
    return encoding == "gzip" || encoding == "x-gzip" || encoding == "deflate";
}

std::string Compression::decompress(const std::string &data, std::string_view contentEncoding)
{
    const std::string encoding = lowercase(contentEncoding);

    // 15 | 16 for gzip framing, 15 | 32 lets zlib detect zlib or gzip headers
    std::string decoded = inflateData(data, encoding == "deflate" ? 15 | 32 : 15 | 16);
    Logger::getInstance()->debug("Decompressed " + encoding + " body: " +
                                 std::to_string(data.size()) + " -> " +
                                 std::to_string(decoded.size()));
    return decoded;
}

std::string Compression::inflateData(const std::string &data, int windowBits)
{
    z_stream zs;                // create a z_stream object for decompression
    memset(&zs, 0, sizeof(zs)); // zero-initialize z_stream structure

    if (inflateInit2(&zs, windowBits) != Z_OK)
    {
        throw TransportError("Failed to initialize zlib");
    }
    InflateGuard guard(zs);

    // set input data for decompression
    zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    int ret;
    char outbuffer[DECOMPRESSION_BUFFER_SIZE];
    std::string decompressed;

    // inflate in a loop until the stream ends or no progress is possible
    do
    {
        zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
        zs.avail_out = DECOMPRESSION_BUFFER_SIZE;

        ret = inflate(&zs, Z_NO_FLUSH);

        if (decompressed.size() < zs.total_out)
        {
            decompressed.append(outbuffer, zs.total_out - decompressed.size());
        }
    } while (ret == Z_OK);

    if (ret != Z_STREAM_END)
    {
        throw TransportError("Failed to decompress body: " +
                             std::string(zs.msg != nullptr ? zs.msg : "truncated stream"));
    }

    return decompressed;
}
