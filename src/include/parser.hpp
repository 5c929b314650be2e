#ifndef ETAGCACHE_PARSER_HPP
#define ETAGCACHE_PARSER_HPP

#include "common.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"

class Parser
{
public:
    // delete copy constructor and assignment operator
    Parser(const Parser &) = delete;
    Parser &operator=(const Parser &) = delete;

    // get singleton instance
    static Parser *getInstance()
    {
        static Parser instance;
        return &instance;
    }

    // parse configuration file, throws ConfigurationError
    [[nodiscard]] Config parseConfig(const std::string &configFilePath);

    // parse configuration from an already loaded document
    [[nodiscard]] Config parseConfig(const json &configJson);

private:
    // private constructor for singleton
    Parser() = default;
};

#endif // ETAGCACHE_PARSER_HPP
