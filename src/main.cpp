#include "common.hpp"
#include "cache.hpp"
#include "config.hpp"
#include "fetcher.hpp"
#include "fingerprint.hpp"
#include "http.hpp"
#include "logger.hpp"
#include "parser.hpp"

std::atomic<bool> running(true); // flag to stop between fetches

void signalHandler([[maybe_unused]] int signal)
{
    running = false; // set running flag to false
}

namespace
{
    // fetch one resource config.passes times, returns the number of failures
    int fetchResource(Fetcher &fetcher, Cache &cache, const Config &config,
                      const std::string &resource)
    {
        int failures = 0;
        std::optional<Digest> fetchedDigest;
        std::optional<Digest> cachedDigest;

        for (int pass = 1; pass <= config.passes && running; ++pass)
        {
            Logger::getInstance()->step(pass, "Fetching " + resource, config.host);

            FetchResult result;
            try
            {
                result = fetcher.get(config.host, resource);
            }
            catch (const CacheInconsistency &e)
            {
                if (!config.refetchOnInconsistency)
                {
                    Logger::getInstance()->error(e.what(), resource);
                    ++failures;
                    continue;
                }
                Logger::getInstance()->warning(std::string(e.what()) + ", retrying unconditionally",
                                               resource);
                result = fetcher.get(config.host, resource, false);
            }

            if (result.success && !result.fromCache)
            {
                fetchedDigest = Fingerprint::md5(*result.body);
                Logger::getInstance()->success("Fetched and cached the file", resource);
            }
            else if (result.success && result.fromCache)
            {
                cachedDigest = Fingerprint::md5(*result.body);
                Logger::getInstance()->success("Got the file from the cache", resource);
            }
            else
            {
                Logger::getInstance()->error("Did not fetch file, status " +
                                                 std::to_string(result.statusCode),
                                             resource);
                ++failures;
            }

            Logger::getInstance()->debug("Cache state:\n" + cache.describe());
        }

        if (fetchedDigest && cachedDigest)
        {
            if (*fetchedDigest != *cachedDigest)
            {
                Logger::getInstance()->error("The file we fetched does not match the cached file",
                                             resource);
                ++failures;
            }
            else
            {
                Logger::getInstance()->success("Cached copy matches the fetched file, md5=" +
                                                   Fingerprint::toHex(*cachedDigest),
                                               resource);
            }
        }
        else if (config.passes > 1 && fetchedDigest && !cachedDigest)
        {
            Logger::getInstance()->warning("Origin never answered Not Modified", resource);
        }
        return failures;
    }
}

auto main(int argc, char *argv[]) -> int
{
    // set up signal handlers with SA_RESTART flag
    struct sigaction sa;
    sa.sa_handler = signalHandler;
    sa.sa_flags = SA_RESTART;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    int failures = 0;
    try
    {
        Socket::ignoreBrokenPipe();

        const std::string configPath = argc > 1 ? argv[1] : "etagcache_conf.json";
        Config config = Parser::getInstance()->parseConfig(configPath);
        Logger::getInstance()->setVerbose(config.verbose);

        HttpClientOptions options;
        options.useTls = config.scheme == "https";
        options.timeout = std::chrono::milliseconds(config.transport.timeoutMs);
        options.userAgent = config.transport.userAgent;
        options.acceptEncoding = config.transport.acceptEncoding;

        Cache cache(config.cache.maxBytes);
        HttpClient client(std::move(options));
        Fetcher fetcher(cache, client);

        auto startTime = std::chrono::steady_clock::now();
        for (const auto &resource : config.resources)
        {
            if (!running)
            {
                Logger::getInstance()->warning("Interrupted, skipping remaining resources");
                break;
            }
            failures += fetchResource(fetcher, cache, config, resource);
        }

        Logger::getInstance()->info(
            "Done in " + Socket::durationToString(std::chrono::steady_clock::now() - startTime) +
            ", cache holds " + std::to_string(cache.count()) + " resources in " +
            std::to_string(cache.size()) + " of " + std::to_string(cache.maxSize()) + " bytes");
    }
    catch (const std::exception &e)
    {
        Logger::getInstance()->error("Fatal error: " + std::string(e.what()));
        Logger::destroyInstance();
        return EXIT_FAILURE;
    }

    if (failures > 0)
    {
        Logger::getInstance()->error(std::to_string(failures) + " fetch(es) failed");
    }
    Logger::destroyInstance();
    return failures > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}
