#include <gtest/gtest.h>

#include "ArchiveNavigator.hpp"

namespace
{

ArchiveInfo archive(const std::string &path, std::size_t count)
{
    ArchiveInfo info;
    info.path = path;
    info.valid = true;
    for (std::size_t i = 0; i < count; ++i)
        info.members.push_back(std::to_string(i) + ".png");
    info.imageCount = count;
    return info;
}

} // namespace

class ArchiveNavigatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        nav.setArchives({archive("/a.zip", 2), archive("/empty.zip", 0), archive("/b.zip", 3)});
    }

    ArchiveNavigator nav;
};

TEST_F(ArchiveNavigatorTest, StartsAtFirstImage)
{
    EXPECT_FALSE(nav.current().has_value());
    auto pos = nav.next();
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->archive, "/a.zip");
    EXPECT_EQ(pos->member, "0.png");
    EXPECT_EQ(pos->archiveIndex, 0u);
    EXPECT_EQ(pos->imageIndex, 0u);
}

TEST_F(ArchiveNavigatorTest, NextCrossesIntoNextNonEmptyArchive)
{
    nav.next();
    nav.next();
    auto pos = nav.next();
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->archive, "/b.zip");
    EXPECT_EQ(pos->imageIndex, 0u);
    EXPECT_EQ(pos->archiveIndex, 2u);
}

TEST_F(ArchiveNavigatorTest, PrevLandsOnLastImageOfPreviousArchive)
{
    ASSERT_TRUE(nav.gotoPosition(2, 0));
    auto pos = nav.prev();
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->archive, "/a.zip");
    EXPECT_EQ(pos->member, "1.png");
    EXPECT_EQ(nav.lastDirection(), Direction::Backward);
}

TEST_F(ArchiveNavigatorTest, StopsAtEndsWithoutLoop)
{
    ASSERT_TRUE(nav.gotoPosition(2, 2));
    EXPECT_FALSE(nav.next().has_value());
    EXPECT_EQ(nav.current()->member, "2.png");

    ASSERT_TRUE(nav.gotoPosition(0, 0));
    EXPECT_FALSE(nav.prev().has_value());
    EXPECT_EQ(nav.current()->archive, "/a.zip");
}

TEST_F(ArchiveNavigatorTest, LoopModeWrapsAround)
{
    nav.setLoopMode(true);
    EXPECT_TRUE(nav.loopMode());

    ASSERT_TRUE(nav.gotoPosition(2, 2));
    auto wrapped = nav.next();
    ASSERT_TRUE(wrapped.has_value());
    EXPECT_EQ(wrapped->archive, "/a.zip");
    EXPECT_EQ(wrapped->imageIndex, 0u);

    auto back = nav.prev();
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->archive, "/b.zip");
    EXPECT_EQ(back->member, "2.png");
}

TEST_F(ArchiveNavigatorTest, DirectionTracksLastMove)
{
    nav.next();
    EXPECT_EQ(nav.lastDirection(), Direction::Forward);
    nav.next();
    nav.prev();
    EXPECT_EQ(nav.lastDirection(), Direction::Backward);
    nav.next();
    EXPECT_EQ(nav.lastDirection(), Direction::Forward);
}

TEST_F(ArchiveNavigatorTest, GotoRejectsInvalidIndices)
{
    nav.next();
    EXPECT_FALSE(nav.gotoPosition(1, 0));
    EXPECT_FALSE(nav.gotoPosition(0, 2));
    EXPECT_FALSE(nav.gotoPosition(3, 0));
    EXPECT_EQ(nav.current()->member, "0.png");
}

TEST_F(ArchiveNavigatorTest, ArchiveJumpsSkipEmptyArchives)
{
    nav.next();
    nav.next();
    auto pos = nav.nextArchive();
    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->archive, "/b.zip");
    EXPECT_EQ(pos->imageIndex, 0u);

    EXPECT_FALSE(nav.nextArchive().has_value());

    ASSERT_TRUE(nav.gotoPosition(2, 1));
    auto back = nav.prevArchive();
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->archive, "/a.zip");
    EXPECT_EQ(back->imageIndex, 0u);
}

TEST(ArchiveNavigatorEmptyTest, NothingToShow)
{
    ArchiveNavigator nav;
    EXPECT_FALSE(nav.next().has_value());
    EXPECT_FALSE(nav.prev().has_value());
    EXPECT_FALSE(nav.nextArchive().has_value());

    nav.setArchives({archive("/empty.zip", 0)});
    EXPECT_FALSE(nav.next().has_value());
    EXPECT_FALSE(nav.current().has_value());
}
