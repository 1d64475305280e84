#include "PreloadScheduler.hpp"

PreloadScheduler::PreloadScheduler(LoadCoordinator &coordinator, ImageCache &cache,
                                   std::size_t depth, std::size_t maxQueued) :
    m_coordinator(coordinator), m_cache(cache), m_depth(depth), m_maxQueued(maxQueued)
{
}

PreloadScheduler::~PreloadScheduler()
{
    cancelAll();
}

void PreloadScheduler::pruneFinishedLocked()
{
    std::erase_if(m_tickets, [](const LoadTicket &t)
                  { return t.ready(); });
}

bool PreloadScheduler::issueLocked(LoadRequest request)
{
    if (m_tickets.size() >= m_maxQueued)
        return false;

    const CacheKey key = request.key();
    if (m_cache.contains(key) || m_cache.contains(key.originalKey()) || m_coordinator.isInFlight(key))
        return false;

    request.priority = LoadPriority::Preload;
    m_tickets.push_back(m_coordinator.submit(std::move(request)));
    spdlog::debug("[PreloadScheduler] Preloading {}", key.toString());
    return true;
}

std::size_t PreloadScheduler::schedule(const fs::path &archive, const std::vector<std::string> &members,
                                       std::size_t currentIndex, Direction direction,
                                       const ImageVariant &variant, std::size_t maxByteSize, bool performanceMode)
{
    if (members.empty() || currentIndex >= members.size() || maxByteSize == 0)
        return 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    pruneFinishedLocked();

    // 按优先顺序排出候选偏移
    std::vector<long long> offsets;
    const long long sign = direction == Direction::Forward ? 1 : -1;
    for (std::size_t d = 1; d <= m_depth; ++d)
        offsets.push_back(sign * static_cast<long long>(d));
    for (std::size_t d = 1; d <= m_depth; ++d)
        offsets.push_back(-sign * static_cast<long long>(d));

    std::size_t issued = 0;
    for (long long offset : offsets)
    {
        const long long idx = static_cast<long long>(currentIndex) + offset;
        if (idx < 0 || idx >= static_cast<long long>(members.size()))
            continue;
        if (m_tickets.size() >= m_maxQueued)
            break;

        LoadRequest request;
        request.archive = archive;
        request.member = members[static_cast<std::size_t>(idx)];
        request.maxByteSize = maxByteSize;
        request.variant = variant;
        request.performanceMode = performanceMode;
        if (issueLocked(std::move(request)))
            ++issued;
    }
    return issued;
}

bool PreloadScheduler::scheduleNextCover(const fs::path &nextArchive, const std::string &firstMember,
                                         int thumbSize, std::size_t maxByteSize, bool performanceMode)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_preloadNextThumbnail || firstMember.empty() || maxByteSize == 0)
        return false;
    pruneFinishedLocked();

    LoadRequest request;
    request.archive = nextArchive;
    request.member = firstMember;
    request.maxByteSize = maxByteSize;
    request.variant = ImageVariant::thumbnail(thumbSize, thumbSize);
    request.cacheVariant = true;
    request.performanceMode = performanceMode;

    // 缩略图作为独立条目缓存，只看它自己的键
    const CacheKey key = request.key();
    if (m_tickets.size() >= m_maxQueued || m_cache.contains(key) || m_coordinator.isInFlight(key))
        return false;

    request.priority = LoadPriority::Preload;
    m_tickets.push_back(m_coordinator.submit(std::move(request)));
    return true;
}

void PreloadScheduler::cancelAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &ticket : m_tickets)
        ticket.cancel();
    m_tickets.clear();
}

void PreloadScheduler::setDepth(std::size_t depth)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_depth = depth;
}

std::size_t PreloadScheduler::depth() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_depth;
}

void PreloadScheduler::setPreloadNextThumbnail(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_preloadNextThumbnail = enabled;
}

bool PreloadScheduler::preloadNextThumbnail() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_preloadNextThumbnail;
}

std::size_t PreloadScheduler::outstanding()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    pruneFinishedLocked();
    return m_tickets.size();
}
