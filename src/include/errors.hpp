#ifndef ETAGCACHE_ERRORS_HPP
#define ETAGCACHE_ERRORS_HPP

#include "common.hpp"

// network, TLS, timeout or HTTP framing failure while talking to the origin
class TransportError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// origin answered 304 Not Modified but nothing was cached to serve
class CacheInconsistency : public std::runtime_error
{
public:
    explicit CacheInconsistency(const std::string &resourceId)
        : std::runtime_error("304 Not Modified received for " + resourceId +
                             " but no body is cached"),
          resource(resourceId)
    {
    }

    [[nodiscard]] const std::string &resourceId() const noexcept { return resource; }

private:
    std::string resource;
};

// invalid byte budget or configuration file
class ConfigurationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

#endif // ETAGCACHE_ERRORS_HPP
