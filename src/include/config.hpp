#ifndef ETAGCACHE_CONFIG_HPP
#define ETAGCACHE_CONFIG_HPP

#include "common.hpp"

struct Config
{
    std::string host;                   // origin as name or name:port
    std::string scheme;                 // "https" or "http"
    std::vector<std::string> resources; // paths to fetch, each starting with '/'
    int passes;                         // fetches per resource
    bool verbose;                       // debug logging and cache dumps
    bool refetchOnInconsistency;        // retry unconditionally after a bodiless 304
    struct
    {
        size_t maxBytes; // byte budget of the cache
    } cache;
    struct
    {
        int timeoutMs;         // connect, send and receive timeout in milliseconds
        std::string userAgent; // User-Agent header
        bool acceptEncoding;   // advertise gzip/deflate
    } transport;
};

#endif // ETAGCACHE_CONFIG_HPP
