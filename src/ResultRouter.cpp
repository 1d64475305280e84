#include "ResultRouter.hpp"

void ConsumerCursor::expect(const CacheKey &key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_expected = key;
}

void ConsumerCursor::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_expected.reset();
}

bool ConsumerCursor::matches(const CacheKey &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_expected && *m_expected == key;
}

std::optional<CacheKey> ConsumerCursor::expected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_expected;
}

ResultRouter::SurfaceId ResultRouter::attach(std::string name, ConsumerCursor *cursor, Handler handler)
{
    std::lock_guard<std::mutex> lock(m_surfaceMutex);
    SurfaceId id = m_nextId++;
    m_surfaces.push_back({id, std::move(name), cursor, std::move(handler)});
    return id;
}

bool ResultRouter::detach(SurfaceId id)
{
    std::lock_guard<std::mutex> lock(m_surfaceMutex);
    auto it = std::ranges::find(m_surfaces, id, &Surface::id);
    if (it == m_surfaces.end())
        return false;
    m_surfaces.erase(it);
    return true;
}

std::size_t ResultRouter::dispatch(const LoadResult &result)
{
    // 复制一份再回调，handler 里可以安全地 attach/detach
    std::vector<Handler> targets;
    {
        std::lock_guard<std::mutex> lock(m_surfaceMutex);
        for (const auto &surface : m_surfaces)
        {
            if (surface.cursor && surface.cursor->matches(result.key) && surface.handler)
                targets.push_back(surface.handler);
        }
    }

    if (targets.empty())
    {
        ++m_dropped;
        spdlog::debug("[ResultRouter] Dropped stale result {}", result.key.toString());
        return 0;
    }

    for (const auto &handler : targets)
        handler(result);
    return targets.size();
}

std::size_t ResultRouter::pump(ResultChannel &channel)
{
    std::size_t delivered = 0;
    for (const auto &result : channel.drain())
        delivered += dispatch(result);
    return delivered;
}
