#ifndef _ARCHIVE_POOL_HPP_
#define _ARCHIVE_POOL_HPP_

#include "PCH.h"
#include "ArchiveHandle.hpp"

/**
 * @class ArchivePool
 * @brief 有上限的已打开压缩包句柄池
 *
 * 打开文件在锁外进行，所以一个慢速/损坏的压缩包不会阻塞其他线程取已有句柄。
 * 超出上限时丢弃最久未用的句柄；由于句柄是 shared_ptr，
 * 正在读取的任务仍持有引用，读完后才会真正关闭。
 */
class ArchivePool
{
public:
    static constexpr std::size_t kDefaultBound = 10;

    /**
     * @throw ArkviewError(InvalidCapacity) 如果 bound 为 0
     */
    explicit ArchivePool(std::size_t bound = kDefaultBound);
    ~ArchivePool();

    ArchivePool(const ArchivePool &) = delete;
    ArchivePool &operator=(const ArchivePool &) = delete;

    /**
     * @brief 取得（必要时打开）一个句柄，并标记为最近使用
     * @throw ArkviewError ArchiveNotFound / ArchivePermissionDenied / ArchiveCorrupt
     */
    std::shared_ptr<ArchiveHandle> acquire(const fs::path &path);

    // 从池中移除，返回是否存在
    bool release(const fs::path &path);
    void closeAll();

    std::size_t size() const;
    std::size_t bound() const
    {
        return m_bound;
    }
    bool contains(const fs::path &path) const;

private:
    struct Entry
    {
        std::shared_ptr<ArchiveHandle> handle;
        std::list<std::string>::iterator lruIt;
    };

    mutable std::mutex m_mutex;
    const std::size_t m_bound;
    std::list<std::string> m_lruList; // front = 最近使用
    std::unordered_map<std::string, Entry> m_handles;
};

#endif
