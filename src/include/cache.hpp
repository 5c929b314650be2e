#ifndef ETAGCACHE_CACHE_HPP
#define ETAGCACHE_CACHE_HPP

#include "common.hpp"
#include "errors.hpp"
#include "fingerprint.hpp"
#include "logger.hpp"

// Byte-bounded store of validators and bodies, one entry per resource.
// Only the variable-length fields count towards the budget; keys and the
// fixed-size body fingerprint do not. An entry's accounted bytes are
// therefore the sum of its ETag, LastModified and Body lengths, not of
// every stored field. Not thread-safe.
class Cache
{
public:
    // byte fields stored per resource
    enum class Field
    {
        ETag,
        LastModified,
        Body
    };

private:
    // Cache entry structure holding everything known about one resource - O(1) access time
    struct CacheEntry
    {
        std::optional<std::string> etag;              // entity tag from the last response carrying one
        std::optional<std::string> lastModified;      // Last-Modified from the last response carrying one
        std::optional<std::string> body;              // body of the last 200 response
        std::optional<Digest> bodyFingerprint;        // md5 of body, outside the byte budget
        std::list<std::string>::iterator lruIterator; // iterator pointing to key's position in lru list

        explicit CacheEntry(std::list<std::string>::iterator it) : lruIterator(it) {}

        [[nodiscard]] std::optional<std::string> &field(Field f);
        [[nodiscard]] const std::optional<std::string> &field(Field f) const;

        // bytes accounted for this entry
        [[nodiscard]] size_t bytes() const;

        // disable copy and assignment operations
        CacheEntry(const CacheEntry &) = delete;
        CacheEntry &operator=(const CacheEntry &) = delete;
    };

    std::unordered_map<std::string, CacheEntry> cache; // main cache storage (key -> entry mapping)
    std::list<std::string> lruList;                    // LRU order tracking list (most recent -> least recent)
    size_t maxBytes;                                   // byte budget, fixed at construction
    size_t currentBytes;                               // bytes of all stored field values

    // helper function to update LRU order - O(1) operation
    void updateLRU(std::unordered_map<std::string, CacheEntry>::iterator it);

    // drop the least recently used entry, false if there is none
    bool evictLRU();

public:
    // throws ConfigurationError for a zero budget
    explicit Cache(size_t maxBytes);

    Cache(const Cache &) = delete;
    Cache &operator=(const Cache &) = delete;

    // store a field value, evicting LRU entries until it fits - O(1) average case per eviction
    // absent/empty values and values that can never fit are not stored
    bool set(const std::string &key, Field field, std::optional<std::string> value);

    // retrieve a field value, a hit makes key the most recently used - O(1) average case
    [[nodiscard]] std::optional<std::string> get(const std::string &key, Field field);

    // annotate an existing entry with its body fingerprint
    bool setFingerprint(const std::string &key, const Digest &digest);
    [[nodiscard]] std::optional<Digest> getFingerprint(const std::string &key);

    // clear all items from cache - O(n)
    void clear();

    // remove a specific item from cache - O(1) average case
    bool remove(const std::string &key);

    // check if an item exists in cache without touching recency - O(1) average case
    [[nodiscard]] bool exists(const std::string &key) const;

    // get current size of cache in bytes - O(1)
    [[nodiscard]] size_t size() const;

    [[nodiscard]] size_t maxSize() const;

    // get number of items in cache - O(1)
    [[nodiscard]] size_t count() const;

    // keys from most to least recently used
    [[nodiscard]] std::vector<std::string> keys() const;

    // human readable dump of entries, recency order and budget
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] static std::string_view fieldName(Field field);
};

#endif // ETAGCACHE_CACHE_HPP
