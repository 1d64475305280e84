#include "ArchiveNavigator.hpp"

void ArchiveNavigator::setArchives(std::vector<ArchiveInfo> archives)
{
    m_archives = std::move(archives);
    m_current.reset();
    m_lastDirection = Direction::Forward;
}

Position ArchiveNavigator::makePosition(std::size_t a, std::size_t i) const
{
    const auto &info = m_archives[a];
    return {info.path, info.members[i], a, i};
}

std::optional<Position> ArchiveNavigator::moveTo(std::size_t a, std::size_t i, Direction dir)
{
    m_current = std::make_pair(a, i);
    m_lastDirection = dir;
    return makePosition(a, i);
}

// 从 from 开始（含）沿方向找第一个有图片的压缩包，按 loopMode 决定是否回绕
std::optional<std::size_t> ArchiveNavigator::findArchive(std::size_t from, bool forward) const
{
    const std::size_t n = m_archives.size();
    if (n == 0)
        return std::nullopt;

    long long idx = static_cast<long long>(from);
    for (std::size_t step = 0; step < n; ++step)
    {
        if (idx < 0 || idx >= static_cast<long long>(n))
        {
            if (!m_loopMode)
                return std::nullopt;
            idx = idx < 0 ? static_cast<long long>(n) - 1 : 0;
        }
        if (!m_archives[static_cast<std::size_t>(idx)].members.empty())
            return static_cast<std::size_t>(idx);
        idx += forward ? 1 : -1;
    }
    return std::nullopt;
}

std::optional<Position> ArchiveNavigator::next()
{
    if (!m_current)
    {
        auto a = findArchive(0, true);
        if (!a)
            return std::nullopt;
        return moveTo(*a, 0, Direction::Forward);
    }

    auto [a, i] = *m_current;
    if (i + 1 < m_archives[a].members.size())
        return moveTo(a, i + 1, Direction::Forward);

    auto target = findArchive(a + 1, true);
    if (!target)
        return std::nullopt;
    return moveTo(*target, 0, Direction::Forward);
}

std::optional<Position> ArchiveNavigator::prev()
{
    if (!m_current)
    {
        auto a = findArchive(0, true);
        if (!a)
            return std::nullopt;
        return moveTo(*a, 0, Direction::Backward);
    }

    auto [a, i] = *m_current;
    if (i > 0)
        return moveTo(a, i - 1, Direction::Backward);

    auto target = a == 0 ? (m_loopMode ? findArchive(m_archives.size() - 1, false) : std::nullopt)
                         : findArchive(a - 1, false);
    if (!target)
        return std::nullopt;
    return moveTo(*target, m_archives[*target].members.size() - 1, Direction::Backward);
}

std::optional<Position> ArchiveNavigator::nextArchive()
{
    const std::size_t from = m_current ? m_current->first + 1 : 0;
    auto target = findArchive(from, true);
    if (!target)
        return std::nullopt;
    return moveTo(*target, 0, Direction::Forward);
}

std::optional<Position> ArchiveNavigator::prevArchive()
{
    if (!m_current)
        return nextArchive();

    const std::size_t a = m_current->first;
    auto target = a == 0 ? (m_loopMode ? findArchive(m_archives.size() - 1, false) : std::nullopt)
                         : findArchive(a - 1, false);
    if (!target)
        return std::nullopt;
    return moveTo(*target, 0, Direction::Backward);
}

bool ArchiveNavigator::gotoPosition(std::size_t archiveIndex, std::size_t imageIndex)
{
    if (archiveIndex >= m_archives.size() || imageIndex >= m_archives[archiveIndex].members.size())
        return false;
    m_current = std::make_pair(archiveIndex, imageIndex);
    return true;
}

std::optional<Position> ArchiveNavigator::current() const
{
    if (!m_current)
        return std::nullopt;
    return makePosition(m_current->first, m_current->second);
}
