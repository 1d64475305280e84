#include "ArchivePool.hpp"
#include "CacheKey.hpp"
#include "LoadError.hpp"

ArchivePool::ArchivePool(std::size_t bound) : m_bound(bound)
{
    if (bound == 0)
        throw ArkviewError(LoadErrorKind::InvalidCapacity, "Archive pool bound must be positive.");
}

ArchivePool::~ArchivePool()
{
    closeAll();
}

std::shared_ptr<ArchiveHandle> ArchivePool::acquire(const fs::path &path)
{
    const std::string key = CacheKey::normalizeArchivePath(path);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handles.find(key);
        if (it != m_handles.end())
        {
            m_lruList.splice(m_lruList.begin(), m_lruList, it->second.lruIt);
            return it->second.handle;
        }
    }

    // 锁外打开；失败直接抛出，不记录失败路径
    std::shared_ptr<ArchiveHandle> opened;
    try
    {
        opened = ArchiveHandle::open(key);
    }
    catch (const ArkviewError &e)
    {
        spdlog::error("[ArchivePool] Failed to open {}: {}", key, e.what());
        throw;
    }

    std::vector<std::shared_ptr<ArchiveHandle>> dropped;
    std::shared_ptr<ArchiveHandle> result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handles.find(key);
        if (it != m_handles.end())
        {
            // 另一个线程抢先打开了，用它的
            m_lruList.splice(m_lruList.begin(), m_lruList, it->second.lruIt);
            result = it->second.handle;
        }
        else
        {
            m_lruList.push_front(key);
            m_handles[key] = {opened, m_lruList.begin()};
            result = opened;

            while (m_handles.size() > m_bound)
            {
                const std::string victim = m_lruList.back();
                m_lruList.pop_back();
                auto vit = m_handles.find(victim);
                dropped.push_back(std::move(vit->second.handle));
                m_handles.erase(vit);
                spdlog::debug("[ArchivePool] Dropped LRU handle {}", victim);
            }
        }
    }
    // dropped 在锁外析构
    return result;
}

bool ArchivePool::release(const fs::path &path)
{
    const std::string key = CacheKey::normalizeArchivePath(path);
    std::shared_ptr<ArchiveHandle> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handles.find(key);
        if (it == m_handles.end())
            return false;
        m_lruList.erase(it->second.lruIt);
        dropped = std::move(it->second.handle);
        m_handles.erase(it);
    }
    return true;
}

void ArchivePool::closeAll()
{
    std::unordered_map<std::string, Entry> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        dropped.swap(m_handles);
        m_lruList.clear();
    }
    if (!dropped.empty())
        spdlog::info("[ArchivePool] Closed {} archive handles", dropped.size());
}

std::size_t ArchivePool::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handles.size();
}

bool ArchivePool::contains(const fs::path &path) const
{
    const std::string key = CacheKey::normalizeArchivePath(path);
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handles.contains(key);
}
