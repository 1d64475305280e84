#include <gtest/gtest.h>

#include "ImageCache.hpp"
#include "LoadError.hpp"

namespace
{

ImageRef makeImage(int w = 10, int h = 10, int channels = 3)
{
    std::vector<std::uint8_t> pixels(static_cast<std::size_t>(w) * h * channels, 7);
    return std::make_shared<const DecodedImage>(w, h, channels, std::move(pixels));
}

CacheKey key(const std::string &member)
{
    return CacheKey("/books/test.zip", member);
}

} // namespace

TEST(ImageCacheTest, ZeroCapacityIsRejected)
{
    try
    {
        ImageCache cache(0);
        FAIL() << "expected ArkviewError";
    }
    catch (const ArkviewError &e)
    {
        EXPECT_EQ(e.kind(), LoadErrorKind::InvalidCapacity);
    }

    ImageCache cache(2);
    EXPECT_THROW(cache.resize(0), ArkviewError);
    EXPECT_EQ(cache.capacity(), 2u);
}

TEST(ImageCacheTest, CapacityTwoScenario)
{
    ImageCache cache(2);
    cache.put(key("A"), makeImage());
    cache.put(key("B"), makeImage());
    ASSERT_NE(cache.get(key("A")), nullptr);
    cache.put(key("C"), makeImage());

    EXPECT_TRUE(cache.contains(key("A")));
    EXPECT_FALSE(cache.contains(key("B")));
    EXPECT_TRUE(cache.contains(key("C")));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST(ImageCacheTest, SizeNeverExceedsCapacity)
{
    ImageCache cache(5);
    for (int i = 0; i < 40; ++i)
    {
        cache.put(key(std::to_string(i)), makeImage());
        ASSERT_LE(cache.size(), 5u);
    }
    EXPECT_EQ(cache.size(), 5u);
    for (int i = 35; i < 40; ++i)
        EXPECT_TRUE(cache.contains(key(std::to_string(i))));
}

TEST(ImageCacheTest, ReplaceKeepsOneEntryAndUpdatesMemory)
{
    ImageCache cache(4);
    auto small = makeImage(10, 10);
    auto large = makeImage(20, 20);
    cache.put(key("A"), small);
    cache.put(key("A"), large);

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.memoryUsage(), large->memoryEstimate());
    EXPECT_EQ(cache.get(key("A")), large);
}

TEST(ImageCacheTest, PeekDoesNotRefreshOrCount)
{
    ImageCache cache(2);
    cache.put(key("A"), makeImage());
    cache.put(key("B"), makeImage());
    EXPECT_NE(cache.peek(key("A")), nullptr);
    cache.put(key("C"), makeImage());

    EXPECT_FALSE(cache.contains(key("A")));
    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
}

TEST(ImageCacheTest, RejectsInvalidImages)
{
    ImageCache cache(2);
    EXPECT_FALSE(cache.put(key("null"), nullptr));
    EXPECT_FALSE(cache.put(key("empty"), std::make_shared<const DecodedImage>()));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(ImageCacheTest, StatsTrackHitsMissesAndMemory)
{
    ImageCache cache(3);
    auto img = makeImage(4, 4, 4);
    cache.put(key("A"), img);
    cache.get(key("A"));
    cache.get(key("A"));
    cache.get(key("missing"));

    CacheStats s = cache.stats();
    EXPECT_EQ(s.size, 1u);
    EXPECT_EQ(s.capacity, 3u);
    EXPECT_EQ(s.hits, 2u);
    EXPECT_EQ(s.misses, 1u);
    EXPECT_NEAR(s.hitRate, 2.0 / 3.0, 1e-9);
    EXPECT_EQ(s.memoryEstimate, 4u * 4u * 4u + DecodedImage::kEntryOverhead);
    EXPECT_EQ(s.strategy, CacheStrategyKind::LRU);
}

TEST(ImageCacheTest, EvictionCallbackReceivesVictim)
{
    ImageCache cache(1);
    std::vector<std::string> evicted;
    cache.setEvictionCallback([&evicted](const CacheKey &k, const ImageRef &img)
                              {
        EXPECT_NE(img, nullptr);
        evicted.push_back(k.member()); });

    cache.put(key("A"), makeImage());
    cache.put(key("B"), makeImage());
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted.front(), "A");
}

TEST(ImageCacheTest, ClearDropsEverythingWithoutCountingEvictions)
{
    ImageCache cache(4);
    int dropped = 0;
    cache.setEvictionCallback([&dropped](const CacheKey &, const ImageRef &)
                              { ++dropped; });
    cache.put(key("A"), makeImage());
    cache.put(key("B"), makeImage());
    cache.clear();

    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.memoryUsage(), 0u);
    EXPECT_EQ(dropped, 2);
    EXPECT_EQ(cache.stats().evictions, 0u);
}

TEST(ImageCacheTest, ResizeEvictsLeastRecentlyUsed)
{
    ImageCache cache(4);
    for (const char *m : {"A", "B", "C", "D"})
        cache.put(key(m), makeImage());
    cache.get(key("A"));
    cache.resize(2);

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.contains(key("A")));
    EXPECT_TRUE(cache.contains(key("D")));
}

TEST(ImageCacheTest, SwitchingStrategyKeepsEntries)
{
    ImageCache cache(3);
    for (const char *m : {"A", "B", "C"})
        cache.put(key(m), makeImage());

    cache.setStrategy(CacheStrategyKind::LFU);
    EXPECT_EQ(cache.strategy(), CacheStrategyKind::LFU);
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.capacity(), 3u);
    for (const char *m : {"A", "B", "C"})
        EXPECT_TRUE(cache.contains(key(m)));

    cache.setStrategy(CacheStrategyKind::Adaptive);
    EXPECT_EQ(cache.strategy(), CacheStrategyKind::Adaptive);
    EXPECT_EQ(cache.size(), 3u);
}

TEST(ImageCacheTest, ConcurrentAccessKeepsInvariant)
{
    ImageCache cache(8);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([&cache, t]()
                             {
            for (int i = 0; i < 500; ++i) {
                CacheKey k = key(std::to_string((i * 7 + t) % 20));
                if (!cache.get(k))
                    cache.put(k, makeImage(2, 2, 1));
            } });
    }
    for (auto &th : threads)
        th.join();

    EXPECT_LE(cache.size(), 8u);
    auto s = cache.stats();
    EXPECT_EQ(s.hits + s.misses, 2000u);
}

// ==========================================
// LFU
// ==========================================

TEST(LfuStrategyTest, EvictsLeastFrequentlyUsed)
{
    ImageCache cache(3, CacheStrategyKind::LFU);
    for (const char *m : {"A", "B", "C"})
        cache.put(key(m), makeImage());
    cache.get(key("A"));
    cache.get(key("A"));
    cache.get(key("B"));

    cache.put(key("D"), makeImage());
    EXPECT_FALSE(cache.contains(key("C")));

    cache.put(key("E"), makeImage());
    EXPECT_FALSE(cache.contains(key("D")));
    EXPECT_TRUE(cache.contains(key("A")));
    EXPECT_TRUE(cache.contains(key("B")));
    EXPECT_TRUE(cache.contains(key("E")));
}

TEST(LfuStrategyTest, TiesEvictOldestInsertion)
{
    ImageCache cache(3, CacheStrategyKind::LFU);
    for (const char *m : {"A", "B", "C", "D"})
        cache.put(key(m), makeImage());
    EXPECT_FALSE(cache.contains(key("A")));
    EXPECT_TRUE(cache.contains(key("B")));
}

TEST(LfuStrategyTest, FrequencyStartsAtOneAndGrows)
{
    LfuStrategy lfu(4, 1 << 20);
    EvictionSink none;
    lfu.put(key("A"), makeImage(), 100, none);
    EXPECT_EQ(lfu.frequencyOf(key("A")), 1u);
    lfu.get(key("A"));
    lfu.get(key("A"));
    EXPECT_EQ(lfu.frequencyOf(key("A")), 3u);
    lfu.peek(key("A"));
    EXPECT_EQ(lfu.frequencyOf(key("A")), 3u);
    EXPECT_EQ(lfu.frequencyOf(key("missing")), 0u);
}

TEST(LfuStrategyTest, MemoryCeilingEvictsBeforeInsert)
{
    const std::size_t entryBytes = makeImage()->memoryEstimate();
    ImageCache cache(10, CacheStrategyKind::LFU, entryBytes * 2 + 10);
    cache.put(key("A"), makeImage());
    cache.put(key("B"), makeImage());
    cache.put(key("C"), makeImage());

    EXPECT_EQ(cache.size(), 2u);
    EXPECT_LE(cache.memoryUsage(), entryBytes * 2 + 10);
    EXPECT_FALSE(cache.contains(key("A")));
}

// ==========================================
// Adaptive LRU
// ==========================================

TEST(AdaptiveLruTest, GrowsWhenHitRateIsLow)
{
    AdaptiveLruStrategy adaptive(20);
    EvictionSink none;
    for (int i = 0; i < 9; ++i)
        adaptive.observeHitRate(0.5, none);
    EXPECT_EQ(adaptive.capacity(), 20u);
    adaptive.observeHitRate(0.5, none);
    EXPECT_EQ(adaptive.capacity(), 25u);
}

TEST(AdaptiveLruTest, ShrinksWhenHitRateIsHighAndRespectsMinimum)
{
    AdaptiveLruStrategy adaptive(12, 10, 200);
    EvictionSink none;
    for (int i = 0; i < 10; ++i)
        adaptive.observeHitRate(0.95, none);
    EXPECT_EQ(adaptive.capacity(), 10u);
    for (int i = 0; i < 10; ++i)
        adaptive.observeHitRate(0.95, none);
    EXPECT_EQ(adaptive.capacity(), 10u);
}

TEST(AdaptiveLruTest, StaysWithinBandBetweenThresholds)
{
    AdaptiveLruStrategy adaptive(50);
    EvictionSink none;
    for (int i = 0; i < 30; ++i)
        adaptive.observeHitRate(0.8, none);
    EXPECT_EQ(adaptive.capacity(), 50u);
}

TEST(AdaptiveLruTest, CacheFeedsHitRateOnPut)
{
    ImageCache cache(20, CacheStrategyKind::Adaptive);
    for (int i = 0; i < 10; ++i)
        cache.put(key(std::to_string(i)), makeImage());
    // 全部未命中，命中率 0 -> 扩容一步
    EXPECT_EQ(cache.capacity(), 25u);
}

TEST(CacheStrategyTest, ParseNames)
{
    EXPECT_EQ(parseStrategy("LRU"), CacheStrategyKind::LRU);
    EXPECT_EQ(parseStrategy("lfu"), CacheStrategyKind::LFU);
    EXPECT_EQ(parseStrategy("Adaptive"), CacheStrategyKind::Adaptive);
    EXPECT_FALSE(parseStrategy("fifo").has_value());
    EXPECT_STREQ(strategyName(CacheStrategyKind::Adaptive), "adaptive");
}
