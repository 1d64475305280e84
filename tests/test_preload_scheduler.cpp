#include <gtest/gtest.h>

#include "PreloadScheduler.hpp"
#include "TestArchives.hpp"
#include "TestDecoders.hpp"

using namespace testutil;

namespace
{

constexpr std::size_t kLimit = 1 << 20;

} // namespace

class PreloadSchedulerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        book = dir / "book.zip";
        std::vector<ZipEntry> entries;
        for (int i = 0; i < 6; ++i)
        {
            members.push_back("p" + std::to_string(i) + ".png");
            entries.push_back({members.back(), encodeImage(".png", 16, 16)});
        }
        writeZip(book, entries);

        next = dir / "next.zip";
        writeZip(next, {{"cover.png", encodeImage(".png", 64, 32)}});
    }

    void TearDown() override
    {
        if (gated)
            decoder.openGate();
        coordinator.waitIdle();
    }

    void gate()
    {
        gated = true;
        decoder.closeGate();
    }
    void release()
    {
        gated = false;
        decoder.openGate();
        coordinator.waitIdle();
    }

    bool inFlight(std::size_t index)
    {
        return coordinator.isInFlight(CacheKey(book, members[index]));
    }

    TempDir dir;
    fs::path book;
    fs::path next;
    std::vector<std::string> members;
    bool gated = false;

    WorkerPool workers{2};
    ImageCache cache{20};
    ArchivePool archives{4};
    CountingDecoder decoder;
    ResultChannel channel;
    LoadCoordinator coordinator{cache, archives, decoder, workers, channel};
};

TEST_F(PreloadSchedulerTest, RequestsNeighboursOnBothSides)
{
    PreloadScheduler scheduler(coordinator, cache, 2, 4);
    gate();

    EXPECT_EQ(scheduler.schedule(book, members, 2, Direction::Forward, ImageVariant::original(), kLimit), 4u);
    EXPECT_TRUE(inFlight(0));
    EXPECT_TRUE(inFlight(1));
    EXPECT_FALSE(inFlight(2));
    EXPECT_TRUE(inFlight(3));
    EXPECT_TRUE(inFlight(4));
    EXPECT_FALSE(inFlight(5));
    EXPECT_EQ(scheduler.outstanding(), 4u);

    release();
    EXPECT_EQ(scheduler.outstanding(), 0u);
    EXPECT_EQ(decoder.decodes(), 4);
    EXPECT_EQ(cache.size(), 4u);
}

TEST_F(PreloadSchedulerTest, DirectionOfTravelComesFirst)
{
    PreloadScheduler forward(coordinator, cache, 2, 2);
    gate();
    EXPECT_EQ(forward.schedule(book, members, 2, Direction::Forward, ImageVariant::original(), kLimit), 2u);
    EXPECT_TRUE(inFlight(3));
    EXPECT_TRUE(inFlight(4));
    EXPECT_FALSE(inFlight(1));
    release();
    cache.clear();

    PreloadScheduler backward(coordinator, cache, 2, 2);
    gate();
    EXPECT_EQ(backward.schedule(book, members, 2, Direction::Backward, ImageVariant::original(), kLimit), 2u);
    EXPECT_TRUE(inFlight(1));
    EXPECT_TRUE(inFlight(0));
    EXPECT_FALSE(inFlight(3));
    release();
}

TEST_F(PreloadSchedulerTest, QueueBoundLimitsOutstandingRequests)
{
    PreloadScheduler scheduler(coordinator, cache, 2, 2);
    gate();
    EXPECT_EQ(scheduler.schedule(book, members, 2, Direction::Forward, ImageVariant::original(), kLimit), 2u);
    // 仍有两个未完成，不再发出
    EXPECT_EQ(scheduler.schedule(book, members, 3, Direction::Forward, ImageVariant::original(), kLimit), 0u);
    release();

    // 完成后名额释放；4 已缓存，跳过
    EXPECT_EQ(scheduler.schedule(book, members, 3, Direction::Forward, ImageVariant::original(), kLimit), 2u);
    release();
    EXPECT_TRUE(cache.contains(CacheKey(book, members[5])));
    EXPECT_TRUE(cache.contains(CacheKey(book, members[2])));
}

TEST_F(PreloadSchedulerTest, SkipsCachedAndInFlightKeys)
{
    PreloadScheduler scheduler(coordinator, cache, 1, 4);

    LoadRequest r;
    r.archive = book;
    r.member = members[3];
    r.maxByteSize = kLimit;
    coordinator.submit(r).get();
    coordinator.waitIdle();

    gate();
    LoadRequest busy = r;
    busy.member = members[1];
    auto ticket = coordinator.submit(busy);

    EXPECT_EQ(scheduler.schedule(book, members, 2, Direction::Forward, ImageVariant::original(), kLimit), 0u);
    EXPECT_EQ(scheduler.outstanding(), 0u);
    release();
    EXPECT_TRUE(ticket.get().success);
    EXPECT_EQ(decoder.decodes(), 2);
}

TEST_F(PreloadSchedulerTest, DerivedVariantSkippedWhenOriginalCached)
{
    PreloadScheduler scheduler(coordinator, cache, 1, 4);

    LoadRequest r;
    r.archive = book;
    r.member = members[1];
    r.maxByteSize = kLimit;
    coordinator.submit(r).get();
    coordinator.waitIdle();

    EXPECT_EQ(scheduler.schedule(book, members, 0, Direction::Forward, ImageVariant::resized(8, 8), kLimit), 0u);
}

TEST_F(PreloadSchedulerTest, EdgesOfListAreRespected)
{
    PreloadScheduler scheduler(coordinator, cache, 2, 4);
    EXPECT_EQ(scheduler.schedule(book, members, 5, Direction::Forward, ImageVariant::original(), kLimit), 2u);
    coordinator.waitIdle();
    EXPECT_TRUE(cache.contains(CacheKey(book, members[4])));
    EXPECT_TRUE(cache.contains(CacheKey(book, members[3])));

    EXPECT_EQ(scheduler.schedule(book, members, 6, Direction::Forward, ImageVariant::original(), kLimit), 0u);
    EXPECT_EQ(scheduler.schedule(book, {}, 0, Direction::Forward, ImageVariant::original(), kLimit), 0u);
}

TEST_F(PreloadSchedulerTest, DepthCanChange)
{
    PreloadScheduler scheduler(coordinator, cache, 2, 4);
    scheduler.setDepth(1);
    EXPECT_EQ(scheduler.depth(), 1u);
    EXPECT_EQ(scheduler.schedule(book, members, 2, Direction::Forward, ImageVariant::original(), kLimit), 2u);
    coordinator.waitIdle();
    EXPECT_FALSE(cache.contains(CacheKey(book, members[4])));
    EXPECT_FALSE(cache.contains(CacheKey(book, members[0])));

    scheduler.setDepth(0);
    EXPECT_EQ(scheduler.schedule(book, members, 4, Direction::Forward, ImageVariant::original(), kLimit), 0u);
}

TEST_F(PreloadSchedulerTest, CancelAllWithdrawsQueuedRequests)
{
    // 先占住两个工作线程
    std::promise<void> blocker;
    std::shared_future<void> blockGate = blocker.get_future().share();
    std::atomic<int> blocked{0};
    for (int i = 0; i < 2; ++i)
        workers.detach(TaskPriority::High, [&blocked, blockGate]()
                       {
                           ++blocked;
                           blockGate.wait(); });
    while (blocked.load() < 2)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    PreloadScheduler scheduler(coordinator, cache, 2, 4);
    EXPECT_EQ(scheduler.schedule(book, members, 2, Direction::Forward, ImageVariant::original(), kLimit), 4u);
    scheduler.cancelAll();
    EXPECT_EQ(scheduler.outstanding(), 0u);

    blocker.set_value();
    coordinator.waitIdle();
    EXPECT_EQ(decoder.decodes(), 0);
    EXPECT_EQ(channel.size(), 0u);
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(PreloadSchedulerTest, NextCoverIsCachedAsThumbnail)
{
    PreloadScheduler scheduler(coordinator, cache);
    EXPECT_TRUE(scheduler.preloadNextThumbnail());
    EXPECT_TRUE(scheduler.scheduleNextCover(next, "cover.png", 16, kLimit));
    coordinator.waitIdle();

    CacheKey thumb(next, "cover.png", ImageVariant::thumbnail(16, 16));
    ASSERT_TRUE(cache.contains(thumb));
    auto image = cache.get(thumb);
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->width(), 16);
    EXPECT_EQ(image->height(), 8);

    // 已缓存，不再重复
    EXPECT_FALSE(scheduler.scheduleNextCover(next, "cover.png", 16, kLimit));
}

TEST_F(PreloadSchedulerTest, NextCoverCanBeDisabled)
{
    PreloadScheduler scheduler(coordinator, cache);
    scheduler.setPreloadNextThumbnail(false);
    EXPECT_FALSE(scheduler.scheduleNextCover(next, "cover.png", 16, kLimit));
    coordinator.waitIdle();
    EXPECT_EQ(decoder.decodes(), 0);
    EXPECT_EQ(cache.size(), 0u);
}
