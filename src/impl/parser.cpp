#include "parser.hpp"

Config Parser::parseConfig(const std::string &configFilePath)
{
    // log start of configuration reading process
    Logger::getInstance()->info("Reading configuration from: " + configFilePath);

    // open configuration file
    std::ifstream file(configFilePath);
    if (!file.is_open())
    {
        Logger::getInstance()->error("Could not open config file: " + configFilePath);
        throw ConfigurationError("Could not open config file: " + configFilePath);
    }

    // parse JSON configuration
    json configJson;
    try
    {
        file >> configJson;
    }
    catch (const json::parse_error &e)
    {
        Logger::getInstance()->error("JSON parsing error: " + std::string(e.what()));
        throw ConfigurationError("Failed to parse configuration file");
    }

    return parseConfig(configJson);
}

Config Parser::parseConfig(const json &configJson)
{
    if (!configJson.is_object())
    {
        Logger::getInstance()->error("Configuration must be a JSON object");
        throw ConfigurationError("Configuration must be a JSON object");
    }

    // check if all required fields exist and are not null
    const std::array<std::pair<std::string, std::string>, 3>
        requiredFields = {{{"host", ""},
                           {"resources", ""},
                           {"cache.max_bytes", "cache"}}};

    for (const auto &[field, parent] : requiredFields)
    {
        if (parent.empty())
        {
            if (!configJson.contains(field) || configJson[field].is_null())
            {
                Logger::getInstance()->error("Missing or null field: " + field);
                throw ConfigurationError("Incomplete configuration file, missing " + field);
            }
        }
        else
        {
            const auto &fieldParts = field.substr(parent.length() + 1);
            if (!configJson.contains(parent) || configJson[parent].is_null() ||
                !configJson[parent].contains(fieldParts) ||
                configJson[parent][fieldParts].is_null())
            {
                Logger::getInstance()->error("Missing or null field: " + field);
                throw ConfigurationError("Incomplete configuration file, missing " + field);
            }
        }
    }

    // create a Config object and populate it with values from JSON
    Config config;
    try
    {
        const json &maxBytes = configJson["cache"]["max_bytes"];
        if (!maxBytes.is_number_integer() || maxBytes.get<long long>() <= 0)
        {
            throw ConfigurationError("Invalid cache byte budget: " + maxBytes.dump());
        }

        const json transport = configJson.value("transport", json::object());

        config.host = configJson["host"].get<std::string>();
        config.scheme = configJson.value("scheme", std::string("https"));
        config.resources = configJson["resources"].get<std::vector<std::string>>();
        config.passes = configJson.value("passes", 2);
        config.verbose = configJson.value("verbose", false);
        config.refetchOnInconsistency = configJson.value("refetch_on_inconsistency", false);
        config.cache.maxBytes = maxBytes.get<size_t>();
        config.transport.timeoutMs = transport.value("timeout_ms", 10000);
        config.transport.userAgent = transport.value("user_agent", std::string("etagcache/1.0"));
        config.transport.acceptEncoding = transport.value("accept_encoding", true);
    }
    catch (const json::exception &e)
    {
        Logger::getInstance()->error("Invalid configuration value: " + std::string(e.what()));
        throw ConfigurationError("Invalid configuration value: " + std::string(e.what()));
    }
    catch (const ConfigurationError &e)
    {
        Logger::getInstance()->error(e.what());
        throw;
    }

    // validate configuration values
    const auto validateConfig = [](const Config &cfg)
    {
        if (cfg.host.empty())
        {
            throw ConfigurationError("Host must not be empty");
        }

        if (cfg.scheme != "https" && cfg.scheme != "http")
        {
            throw ConfigurationError("Unsupported scheme: " + cfg.scheme);
        }

        // validate resource paths
        if (cfg.resources.empty())
        {
            throw ConfigurationError("No resources to fetch");
        }
        for (const auto &resource : cfg.resources)
        {
            if (resource.empty() || resource.front() != '/')
            {
                throw ConfigurationError("Resource path must start with '/': " + resource);
            }
        }

        if (cfg.passes <= 0)
        {
            throw ConfigurationError("Invalid pass count: " + std::to_string(cfg.passes));
        }

        if (cfg.transport.timeoutMs <= 0)
        {
            throw ConfigurationError("Invalid transport timeout: " +
                                     std::to_string(cfg.transport.timeoutMs) + " ms");
        }
    };

    try
    {
        validateConfig(config);
    }
    catch (const ConfigurationError &e)
    {
        Logger::getInstance()->error(e.what());
        throw;
    }

    // log successful configuration loading
    Logger::getInstance()->success("Configuration loaded successfully");

    return config;
}
