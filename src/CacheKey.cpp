#include "CacheKey.hpp"

std::string CacheKey::normalizeArchivePath(const fs::path &archive)
{
    if (archive.empty())
        return {};

    std::error_code ec;
    fs::path abs = fs::absolute(archive, ec);
    if (ec) // 若出错则使用原给出路径
        abs = archive;
    return abs.lexically_normal().string();
}

CacheKey::CacheKey(const fs::path &archive, std::string member, ImageVariant variant) :
    m_archive(normalizeArchivePath(archive)), m_member(std::move(member)), m_variant(variant)
{
}

CacheKey CacheKey::originalKey() const
{
    return withVariant(ImageVariant::original());
}

CacheKey CacheKey::withVariant(const ImageVariant &variant) const
{
    CacheKey key = *this;
    key.m_variant = variant;
    return key;
}

std::string CacheKey::toString() const
{
    switch (m_variant.kind)
    {
    case VariantKind::Thumbnail:
        return fmt::format("{}::{}@thumb({}x{})", m_archive, m_member, m_variant.width, m_variant.height);
    case VariantKind::Resized:
        return fmt::format("{}::{}@resized({}x{})", m_archive, m_member, m_variant.width, m_variant.height);
    case VariantKind::Original:
    default:
        return fmt::format("{}::{}@original", m_archive, m_member);
    }
}
