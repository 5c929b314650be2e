#include "cache.hpp"

std::optional<std::string> &Cache::CacheEntry::field(Field f)
{
    switch (f)
    {
    case Field::ETag:
        return etag;
    case Field::LastModified:
        return lastModified;
    case Field::Body:
        break;
    }
    return body;
}

const std::optional<std::string> &Cache::CacheEntry::field(Field f) const
{
    switch (f)
    {
    case Field::ETag:
        return etag;
    case Field::LastModified:
        return lastModified;
    case Field::Body:
        break;
    }
    return body;
}

size_t Cache::CacheEntry::bytes() const
{
    size_t total = 0;
    for (const auto *value : {&etag, &lastModified, &body})
    {
        if (*value)
        {
            total += (*value)->size();
        }
    }
    return total;
}

Cache::Cache(size_t maxBytes) : maxBytes(maxBytes), currentBytes(0)
{
    if (maxBytes == 0)
    {
        throw ConfigurationError("Cache byte budget must be positive");
    }
}

// helper function to update LRU order - O(1) operation
void Cache::updateLRU(std::unordered_map<std::string, CacheEntry>::iterator it)
{
    lruList.erase(it->second.lruIterator); // remove from current position
    lruList.push_front(it->first);         // add to front (most recently used)
    it->second.lruIterator = lruList.begin();
}

bool Cache::evictLRU()
{
    if (lruList.empty())
    {
        return false;
    }

    const std::string lruKey = lruList.back();
    size_t recovered = 0;
    auto it = cache.find(lruKey);
    if (it != cache.end())
    {
        recovered = it->second.bytes();
        currentBytes -= recovered;
        cache.erase(it);
    }
    lruList.pop_back();

    Logger::getInstance()->info("Evicted " + lruKey + " from the cache and recovered " +
                                std::to_string(recovered) + " bytes, current size: " +
                                std::to_string(currentBytes) + " bytes");
    return true;
}

bool Cache::set(const std::string &key, Field field, std::optional<std::string> value)
{
    if (!value || value->empty())
    {
        return false;
    }

    const size_t requiredSize = value->size();
    if (requiredSize >= maxBytes)
    {
        Logger::getInstance()->warning(
            "Not caching " + std::string(fieldName(field)) + " of " + key + ": " +
            std::to_string(requiredSize) + " bytes exceeds the cache budget of " +
            std::to_string(maxBytes) + " bytes");
        return false; // don't cache if too large
    }

    // the key being written becomes the most recently used one, so eviction never picks it
    auto it = cache.find(key);
    size_t replacedSize = 0;
    if (it != cache.end())
    {
        updateLRU(it);
        if (const auto &slot = it->second.field(field))
        {
            replacedSize = slot->size();
        }
    }

    // ensure space available, the replaced value's bytes count as recovered
    while (currentBytes - replacedSize + requiredSize >= maxBytes &&
           !lruList.empty() && lruList.back() != key && evictLRU())
    {
    }

    // only the key's own other fields are left and they leave no room
    if (currentBytes - replacedSize + requiredSize >= maxBytes)
    {
        Logger::getInstance()->warning(
            "Not caching " + std::string(fieldName(field)) + " of " + key + ": " +
            std::to_string(requiredSize) + " bytes do not fit beside its other fields");
        return false;
    }

    if (it == cache.end())
    {
        try
        {
            // add to lru first, then to cache
            lruList.push_front(key);
            it = cache.emplace(std::piecewise_construct,
                               std::forward_as_tuple(key),
                               std::forward_as_tuple(lruList.begin()))
                     .first;
        }
        catch (const std::exception &e)
        {
            // rollback on failure
            lruList.pop_front();
            Logger::getInstance()->error("cache allocation failed: " + std::string(e.what()));
            return false;
        }
    }

    // overwriting recovers the old value's bytes first
    auto &slot = it->second.field(field);
    if (slot)
    {
        currentBytes -= slot->size();
    }
    slot = std::move(value);
    currentBytes += requiredSize;

    Logger::getInstance()->debug("Stored " + std::string(fieldName(field)) + " (" +
                                     std::to_string(requiredSize) + " bytes), current size: " +
                                     std::to_string(currentBytes) + " bytes",
                                 key);
    return true;
}

std::optional<std::string> Cache::get(const std::string &key, Field field)
{
    auto it = cache.find(key);
    if (it == cache.end())
    {
        return std::nullopt;
    }

    const auto &slot = it->second.field(field);
    if (!slot)
    {
        return std::nullopt;
    }

    updateLRU(it);
    return slot;
}

bool Cache::setFingerprint(const std::string &key, const Digest &digest)
{
    auto it = cache.find(key);
    if (it == cache.end())
    {
        return false;
    }

    it->second.bodyFingerprint = digest;
    updateLRU(it);
    return true;
}

std::optional<Digest> Cache::getFingerprint(const std::string &key)
{
    auto it = cache.find(key);
    if (it == cache.end() || !it->second.bodyFingerprint)
    {
        return std::nullopt;
    }

    updateLRU(it);
    return it->second.bodyFingerprint;
}

// clear all items from cache
void Cache::clear()
{
    cache.clear();
    lruList.clear();
    currentBytes = 0;
}

// remove a specific item from cache - O(1) average case
bool Cache::remove(const std::string &key)
{
    auto it = cache.find(key);
    if (it != cache.end())
    {
        currentBytes -= it->second.bytes();
        lruList.erase(it->second.lruIterator);
        cache.erase(it);
        return true;
    }
    return false;
}

// check if an item exists in cache - O(1) average case
bool Cache::exists(const std::string &key) const
{
    return cache.find(key) != cache.end();
}

// get current size of cache in bytes - O(1)
size_t Cache::size() const
{
    return currentBytes;
}

size_t Cache::maxSize() const
{
    return maxBytes;
}

// get number of items in cache - O(1)
size_t Cache::count() const
{
    return cache.size();
}

std::vector<std::string> Cache::keys() const
{
    return {lruList.begin(), lruList.end()};
}

std::string Cache::describe() const
{
    static constexpr size_t MAX_PRINTED_VALUE = 70; // larger values are elided

    std::ostringstream oss;
    oss << cache.size() << " Cache Item" << (cache.size() == 1 ? "" : "s") << ":\n";
    for (const auto &key : lruList)
    {
        const auto &entry = cache.at(key);
        oss << "  " << key << "\n";
        for (Field field : {Field::ETag, Field::LastModified, Field::Body})
        {
            const auto &value = entry.field(field);
            if (!value)
            {
                continue;
            }
            oss << "    " << fieldName(field) << ": ";
            if (field != Field::Body && value->size() <= MAX_PRINTED_VALUE)
            {
                oss << *value << "\n";
            }
            else
            {
                oss << value->size() << " bytes\n";
            }
        }
        if (entry.bodyFingerprint)
        {
            oss << "    BodyFingerprint: " << Fingerprint::toHex(*entry.bodyFingerprint) << "\n";
        }
    }

    oss << "LRU list (last key is LRU):\n";
    for (const auto &key : lruList)
    {
        oss << "  " << key << "\n";
    }
    oss << "Max cache size: " << maxBytes << " bytes\n"
        << "  Current size: " << currentBytes << " bytes\n"
        << "        Unused: " << maxBytes - currentBytes << " bytes\n";
    return oss.str();
}

std::string_view Cache::fieldName(Field field)
{
    switch (field)
    {
    case Field::ETag:
        return "ETag";
    case Field::LastModified:
        return "LastModified";
    case Field::Body:
        break;
    }
    return "Body";
}
