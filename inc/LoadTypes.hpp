#ifndef _LOAD_TYPES_HPP_
#define _LOAD_TYPES_HPP_

#include "PCH.h"
#include "CacheKey.hpp"
#include "DecodedImage.hpp"
#include "LoadError.hpp"

enum class LoadPriority : std::uint8_t
{
    Normal,
    Preload
};

// 浏览方向，决定预加载的先后顺序
enum class Direction : std::uint8_t
{
    Forward,
    Backward
};

struct LoadRequest
{
    fs::path archive;
    std::string member;
    std::size_t maxByteSize = 0;
    ImageVariant variant;
    bool forceReload = false;
    LoadPriority priority = LoadPriority::Normal;
    bool performanceMode = false;
    // 把派生变体也作为独立条目缓存（例如画廊缩略图）
    bool cacheVariant = false;

    CacheKey key() const
    {
        return CacheKey(archive, member, variant);
    }
};

struct LoadResult
{
    bool success = false;
    ImageRef image;
    LoadErrorKind error = LoadErrorKind::None;
    std::string message;
    CacheKey key;

    static LoadResult ok(CacheKey key, ImageRef image)
    {
        LoadResult r;
        r.success = true;
        r.image = std::move(image);
        r.key = std::move(key);
        return r;
    }

    static LoadResult failure(CacheKey key, LoadErrorKind kind, std::string message)
    {
        LoadResult r;
        r.error = kind;
        r.message = std::move(message);
        r.key = std::move(key);
        return r;
    }
};

#endif
