#include <gtest/gtest.h>

#include "CacheKey.hpp"

TEST(CacheKeyTest, RelativeAndAbsolutePathsAreTheSameKey)
{
    const fs::path cwd = fs::current_path();
    CacheKey relative("books/a.zip", "001.png");
    CacheKey dotted("./books/../books/a.zip", "001.png");
    CacheKey absolute(cwd / "books" / "a.zip", "001.png");

    EXPECT_EQ(relative, dotted);
    EXPECT_EQ(relative, absolute);
    EXPECT_EQ(std::hash<CacheKey>{}(relative), std::hash<CacheKey>{}(absolute));
    EXPECT_TRUE(fs::path(relative.archive()).is_absolute());
}

TEST(CacheKeyTest, VariantIsPartOfIdentity)
{
    CacheKey original("a.zip", "p.png");
    CacheKey thumb("a.zip", "p.png", ImageVariant::thumbnail(280, 280));
    CacheKey otherThumb("a.zip", "p.png", ImageVariant::thumbnail(180, 180));
    CacheKey resized("a.zip", "p.png", ImageVariant::resized(280, 280));

    EXPECT_NE(original, thumb);
    EXPECT_NE(thumb, otherThumb);
    EXPECT_NE(thumb, resized);
    EXPECT_EQ(thumb.originalKey(), original);
    EXPECT_EQ(original.withVariant(ImageVariant::thumbnail(280, 280)), thumb);
}

TEST(CacheKeyTest, MemberNamesAreCaseSensitive)
{
    EXPECT_NE(CacheKey("a.zip", "P.png"), CacheKey("a.zip", "p.png"));
}

TEST(CacheKeyTest, ToStringShowsVariant)
{
    CacheKey thumb("a.zip", "dir/p.png", ImageVariant::thumbnail(64, 32));
    const std::string text = thumb.toString();
    EXPECT_NE(text.find("a.zip::dir/p.png"), std::string::npos);
    EXPECT_NE(text.find("@thumb(64x32)"), std::string::npos);
    EXPECT_NE(CacheKey("a.zip", "p.png").toString().find("@original"), std::string::npos);
}

TEST(CacheKeyTest, ToStringExactForm)
{
    CacheKey original("a.zip", "p.png");
    const std::string prefix = original.archive() + "::p.png";
    EXPECT_EQ(original.toString(), prefix + "@original");
    EXPECT_EQ(original.withVariant(ImageVariant::thumbnail(64, 32)).toString(), prefix + "@thumb(64x32)");
    EXPECT_EQ(original.withVariant(ImageVariant::resized(800, 600)).toString(), prefix + "@resized(800x600)");
}

TEST(CacheKeyTest, UsableInUnorderedMap)
{
    std::unordered_map<CacheKey, int> map;
    map[CacheKey("a.zip", "1.png")] = 1;
    map[CacheKey("./a.zip", "1.png")] = 2;
    map[CacheKey("a.zip", "1.png", ImageVariant::thumbnail(10, 10))] = 3;

    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.at(CacheKey("a.zip", "1.png")), 2);
}
