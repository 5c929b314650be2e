#include <gtest/gtest.h>

#include "cache.hpp"

using Field = Cache::Field;

// A fresh cache holds nothing
TEST(Cache, StartsEmpty)
{
    Cache cache(40);
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.count(), 0u);
    EXPECT_EQ(cache.maxSize(), 40u);
    EXPECT_FALSE(cache.get("url1", Field::ETag).has_value());
}

// A zero byte budget is rejected at construction
TEST(Cache, ZeroBudgetIsRejected)
{
    EXPECT_THROW(Cache cache(0), ConfigurationError);
}

// Values are accounted by their length, keys are not
TEST(Cache, SetAndGet)
{
    Cache cache(40);
    EXPECT_TRUE(cache.set("url1", Field::ETag, std::string("abcdefghij")));
    EXPECT_EQ(cache.size(), 10u);
    EXPECT_EQ(cache.get("url1", Field::ETag), "abcdefghij");
    EXPECT_FALSE(cache.get("url1", Field::LastModified).has_value());
    EXPECT_FALSE(cache.get("url2", Field::ETag).has_value());

    EXPECT_TRUE(cache.set("url1", Field::Body, std::string("0123456789")));
    EXPECT_EQ(cache.size(), 20u);
    EXPECT_EQ(cache.count(), 1u);
}

// Overwriting a field changes the size by the difference only
TEST(Cache, OverwriteAccounting)
{
    Cache cache(100);
    cache.set("url1", Field::ETag, std::string("abcdefghij"));
    cache.set("url1", Field::ETag, std::string("abcdefghij"));
    EXPECT_EQ(cache.size(), 10u);

    cache.set("other", Field::Body, std::string(5, 'x'));
    const size_t before = cache.size();
    cache.set("url1", Field::Body, std::string(30, 'a'));
    cache.set("url1", Field::Body, std::string(12, 'b'));
    EXPECT_EQ(cache.size(), before + 12);
    EXPECT_EQ(cache.get("url1", Field::Body), std::string(12, 'b'));
}

// Absent and empty values never change the cache
TEST(Cache, AbsentValueIsNoop)
{
    Cache cache(20);
    cache.set("url1", Field::Body, std::string(15, 'x'));

    EXPECT_FALSE(cache.set("url2", Field::ETag, std::nullopt));
    EXPECT_FALSE(cache.set("url2", Field::ETag, std::string()));
    EXPECT_EQ(cache.size(), 15u);
    EXPECT_EQ(cache.count(), 1u);
    EXPECT_FALSE(cache.exists("url2"));
    EXPECT_TRUE(cache.exists("url1"));
}

// Filling the cache evicts the least recently used key with all its fields
TEST(Cache, EvictsLeastRecentlyUsed)
{
    Cache cache(40);
    cache.set("url1", Field::ETag, std::string("abcdefghij"));
    cache.set("url1", Field::Body, std::string("0123456789"));
    cache.set("url2", Field::ETag, std::string("abcdefghij"));
    EXPECT_EQ(cache.size(), 30u);

    // 30 + 10 reaches the budget
    cache.set("url3", Field::ETag, std::string("abcdefghij"));
    EXPECT_EQ(cache.size(), 20u);
    EXPECT_FALSE(cache.exists("url1"));
    EXPECT_TRUE(cache.exists("url2"));
    EXPECT_TRUE(cache.exists("url3"));
}

// A read makes a key the most recently used one
TEST(Cache, GetRefreshesRecency)
{
    Cache cache(40);
    cache.set("a", Field::Body, std::string(10, 'a'));
    cache.set("b", Field::Body, std::string(10, 'b'));
    cache.set("c", Field::Body, std::string(10, 'c'));

    ASSERT_TRUE(cache.get("a", Field::Body).has_value());
    cache.set("d", Field::Body, std::string(10, 'd'));

    EXPECT_TRUE(cache.exists("a"));
    EXPECT_FALSE(cache.exists("b"));
    EXPECT_EQ(cache.keys(), (std::vector<std::string>{"d", "a", "c"}));
}

// A miss leaves the recency order alone
TEST(Cache, MissDoesNotRefreshRecency)
{
    Cache cache(100);
    cache.set("a", Field::Body, std::string(10, 'a'));
    cache.set("b", Field::Body, std::string(10, 'b'));

    EXPECT_FALSE(cache.get("a", Field::ETag).has_value());
    EXPECT_EQ(cache.keys(), (std::vector<std::string>{"b", "a"}));
}

// Eviction keeps going until the new value fits
TEST(Cache, EvictsUntilValueFits)
{
    Cache cache(100);
    cache.set("a", Field::Body, std::string(30, 'a'));
    cache.set("b", Field::Body, std::string(30, 'b'));
    cache.set("c", Field::Body, std::string(30, 'c'));

    cache.set("d", Field::Body, std::string(75, 'd'));
    EXPECT_EQ(cache.keys(), (std::vector<std::string>{"d"}));
    EXPECT_EQ(cache.size(), 75u);
    EXPECT_LT(cache.size(), cache.maxSize());
}

// A value that can never fit is rejected without evicting anything
TEST(Cache, OversizedValueIsRejected)
{
    Cache cache(50);
    cache.set("a", Field::Body, std::string(20, 'a'));

    EXPECT_FALSE(cache.set("big", Field::Body, std::string(50, 'x')));
    EXPECT_FALSE(cache.exists("big"));
    EXPECT_TRUE(cache.exists("a"));
    EXPECT_EQ(cache.size(), 20u);
}

// 900 bytes then 300 bytes in a 1024 byte cache leaves only the second body
TEST(Cache, ConcreteBudgetScenario)
{
    Cache cache(1024);
    cache.set("/a", Field::Body, std::string(900, 'a'));
    EXPECT_EQ(cache.size(), 900u);

    cache.set("/b", Field::Body, std::string(300, 'b'));
    EXPECT_EQ(cache.size(), 300u);
    EXPECT_FALSE(cache.exists("/a"));
    EXPECT_FALSE(cache.get("/a", Field::Body).has_value());
}

// The fingerprint sits outside the byte budget and needs an existing entry
TEST(Cache, FingerprintIsMetadata)
{
    Cache cache(100);
    const Digest digest = Fingerprint::md5("hello");

    EXPECT_FALSE(cache.setFingerprint("a", digest));
    EXPECT_FALSE(cache.exists("a"));

    cache.set("a", Field::Body, std::string("hello"));
    EXPECT_TRUE(cache.setFingerprint("a", digest));
    EXPECT_EQ(cache.size(), 5u);
    EXPECT_EQ(cache.getFingerprint("a"), digest);
}

// Removing a key recovers exactly its bytes
TEST(Cache, RemoveRecoversBytes)
{
    Cache cache(100);
    cache.set("a", Field::ETag, std::string(4, 'e'));
    cache.set("a", Field::Body, std::string(10, 'a'));
    cache.set("b", Field::Body, std::string(7, 'b'));

    EXPECT_TRUE(cache.remove("a"));
    EXPECT_FALSE(cache.remove("a"));
    EXPECT_EQ(cache.size(), 7u);
    EXPECT_EQ(cache.keys(), (std::vector<std::string>{"b"}));
}

// Clear empties entries, recency and accounting
TEST(Cache, Clear)
{
    Cache cache(100);
    cache.set("a", Field::Body, std::string(10, 'a'));
    cache.set("b", Field::Body, std::string(10, 'b'));

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.count(), 0u);
    EXPECT_TRUE(cache.keys().empty());

    cache.set("c", Field::Body, std::string(10, 'c'));
    EXPECT_EQ(cache.size(), 10u);
}

// The dump lists entries, the LRU order and the budget
TEST(Cache, Describe)
{
    Cache cache(100);
    cache.set("/a", Field::ETag, std::string("\"v1\""));
    cache.set("/a", Field::Body, std::string(20, 'a'));

    const std::string dump = cache.describe();
    EXPECT_NE(dump.find("1 Cache Item:"), std::string::npos);
    EXPECT_NE(dump.find("ETag: \"v1\""), std::string::npos);
    EXPECT_NE(dump.find("Body: 20 bytes"), std::string::npos);
    EXPECT_NE(dump.find("Current size: 24 bytes"), std::string::npos);
}

// Writing to an existing key makes it the most recently used one
TEST(Cache, SetRefreshesRecency)
{
    Cache cache(40);
    cache.set("a", Field::Body, std::string(10, 'a'));
    cache.set("b", Field::Body, std::string(10, 'b'));
    cache.set("c", Field::Body, std::string(10, 'c'));

    ASSERT_TRUE(cache.set("a", Field::ETag, std::string(5, 'e')));
    EXPECT_EQ(cache.keys(), (std::vector<std::string>{"a", "c", "b"}));

    cache.set("d", Field::Body, std::string(10, 'd'));
    EXPECT_TRUE(cache.exists("a"));
    EXPECT_FALSE(cache.exists("b"));
    EXPECT_EQ(cache.size(), 35u);
}

// Overwriting counts the replaced bytes as free and never evicts the key itself
TEST(Cache, OverwriteDoesNotEvictItself)
{
    Cache cache(100);
    cache.set("a", Field::Body, std::string(60, 'a'));
    cache.set("b", Field::Body, std::string(20, 'b'));

    EXPECT_TRUE(cache.set("a", Field::Body, std::string(70, 'A')));
    EXPECT_EQ(cache.keys(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(cache.size(), 90u);
}

// Overwriting evicts other keys when the net growth does not fit
TEST(Cache, OverwriteEvictsOtherKeys)
{
    Cache cache(100);
    cache.set("a", Field::Body, std::string(50, 'a'));
    cache.set("b", Field::Body, std::string(40, 'b'));

    EXPECT_TRUE(cache.set("a", Field::Body, std::string(65, 'A')));
    EXPECT_EQ(cache.keys(), (std::vector<std::string>{"a"}));
    EXPECT_EQ(cache.size(), 65u);
}

// A value that only fits without the key's own other fields is rejected
TEST(Cache, OverwriteBlockedByOwnFields)
{
    Cache cache(100);
    cache.set("a", Field::ETag, std::string(40, 'e'));
    cache.set("a", Field::Body, std::string(50, 'a'));

    EXPECT_FALSE(cache.set("a", Field::Body, std::string(70, 'A')));
    EXPECT_EQ(cache.get("a", Field::Body), std::string(50, 'a'));
    EXPECT_EQ(cache.size(), 90u);
}
