#ifndef ARCHIVE_NAVIGATOR_HPP
#define ARCHIVE_NAVIGATOR_HPP

#include "PCH.h"
#include "ArchiveScanner.hpp"
#include "LoadTypes.hpp"

// 浏览位置：第几个压缩包中的第几张图
struct Position
{
    std::string archive;
    std::string member;
    std::size_t archiveIndex = 0;
    std::size_t imageIndex = 0;
};

/**
 * @class ArchiveNavigator
 * @brief 跨压缩包的前后翻页
 * 往前翻进上一个压缩包时落在它的最后一张；只有 loopMode 打开时才首尾相接。
 * 没有图片的压缩包会被跳过。不是线程安全的，只在 UI 线程使用。
 */
class ArchiveNavigator
{
public:
    void setArchives(std::vector<ArchiveInfo> archives);
    const std::vector<ArchiveInfo> &archives() const
    {
        return m_archives;
    }

    std::optional<Position> next();
    std::optional<Position> prev();
    std::optional<Position> nextArchive();
    std::optional<Position> prevArchive();

    // 非法下标直接忽略，返回 false
    bool gotoPosition(std::size_t archiveIndex, std::size_t imageIndex);

    std::optional<Position> current() const;

    Direction lastDirection() const
    {
        return m_lastDirection;
    }

    void setLoopMode(bool loop)
    {
        m_loopMode = loop;
    }
    bool loopMode() const
    {
        return m_loopMode;
    }

private:
    std::optional<std::size_t> findArchive(std::size_t from, bool forward) const;
    Position makePosition(std::size_t a, std::size_t i) const;
    std::optional<Position> moveTo(std::size_t a, std::size_t i, Direction dir);

    std::vector<ArchiveInfo> m_archives;
    std::optional<std::pair<std::size_t, std::size_t>> m_current;
    bool m_loopMode = false;
    Direction m_lastDirection = Direction::Forward;
};

#endif
