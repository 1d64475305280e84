#ifndef _CACHE_KEY_HPP_
#define _CACHE_KEY_HPP_

#include "PCH.h"

// 同一成员的不同解码表示
enum class VariantKind : std::uint8_t
{
    Original,
    Thumbnail,
    Resized
};

struct ImageVariant
{
    VariantKind kind = VariantKind::Original;
    int width = 0;
    int height = 0;

    static ImageVariant original()
    {
        return {};
    }
    static ImageVariant thumbnail(int w, int h)
    {
        return {VariantKind::Thumbnail, w, h};
    }
    static ImageVariant resized(int w, int h)
    {
        return {VariantKind::Resized, w, h};
    }

    bool isOriginal() const
    {
        return kind == VariantKind::Original;
    }

    bool operator==(const ImageVariant &) const = default;
};

/**
 * @brief (压缩包, 成员, 变体) 三元组
 *
 * 压缩包路径在构造时规范化为绝对路径，所以 "a.zip" 与 "./a.zip" 是同一个键。
 * 键不可变，可作为 unordered_map 的 key。
 */
class CacheKey
{
public:
    CacheKey() = default;
    CacheKey(const fs::path &archive, std::string member, ImageVariant variant = ImageVariant::original());

    const std::string &archive() const
    {
        return m_archive;
    }
    const std::string &member() const
    {
        return m_member;
    }
    const ImageVariant &variant() const
    {
        return m_variant;
    }

    // 同一源字节的 Original 键
    CacheKey originalKey() const;
    CacheKey withVariant(const ImageVariant &variant) const;

    std::string toString() const;

    bool operator==(const CacheKey &) const = default;

    static std::string normalizeArchivePath(const fs::path &archive);

private:
    std::string m_archive;
    std::string m_member;
    ImageVariant m_variant;
};

template <>
struct std::hash<CacheKey>
{
    std::size_t operator()(const CacheKey &key) const noexcept
    {
        std::size_t h = std::hash<std::string>{}(key.archive());
        auto mix = [&h](std::size_t v)
        { h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2); };
        mix(std::hash<std::string>{}(key.member()));
        mix(static_cast<std::size_t>(key.variant().kind));
        mix(std::hash<int>{}(key.variant().width));
        mix(std::hash<int>{}(key.variant().height));
        return h;
    }
};

#endif
