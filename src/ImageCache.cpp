#include "ImageCache.hpp"
#include "LoadError.hpp"

ImageCache::ImageCache(std::size_t capacity, CacheStrategyKind strategy, std::size_t maxMemoryBytes) :
    m_maxMemoryBytes(maxMemoryBytes)
{
    if (capacity == 0)
        throw ArkviewError(LoadErrorKind::InvalidCapacity, "Cache capacity must be positive.");
    m_impl = makeStrategy(strategy, capacity);
}

std::unique_ptr<CacheStrategy> ImageCache::makeStrategy(CacheStrategyKind kind, std::size_t capacity) const
{
    switch (kind)
    {
    case CacheStrategyKind::LFU:
        return std::make_unique<LfuStrategy>(capacity, m_maxMemoryBytes);
    case CacheStrategyKind::Adaptive:
        return std::make_unique<AdaptiveLruStrategy>(capacity);
    case CacheStrategyKind::LRU:
    default:
        return std::make_unique<LruStrategy>(capacity);
    }
}

double ImageCache::hitRateLocked() const
{
    const std::uint64_t total = m_hits + m_misses;
    return total > 0 ? static_cast<double>(m_hits) / static_cast<double>(total) : 0.0;
}

void ImageCache::notifyEvicted(const std::vector<std::pair<CacheKey, ImageRef>> &evicted) const
{
    if (evicted.empty())
        return;

    EvictionCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        cb = m_onEvict;
    }
    if (!cb)
        return;
    for (const auto &[key, image] : evicted)
        cb(key, image);
}

ImageRef ImageCache::get(const CacheKey &key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ImageRef image = m_impl->get(key);
    if (image)
        ++m_hits;
    else
        ++m_misses;
    return image;
}

ImageRef ImageCache::peek(const CacheKey &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_impl->peek(key);
}

bool ImageCache::put(const CacheKey &key, ImageRef image)
{
    if (!image || !image->isValid())
    {
        spdlog::warn("[ImageCache] Refusing to cache invalid image for key {}", key.toString());
        return false;
    }

    const std::size_t bytes = image->memoryEstimate();
    std::vector<std::pair<CacheKey, ImageRef>> evicted;
    EvictionCallback sink = [&evicted](const CacheKey &k, const ImageRef &v)
    { evicted.emplace_back(k, v); };
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_impl->observeHitRate(hitRateLocked(), sink);
        m_impl->put(key, std::move(image), bytes, sink);
        m_evictions += evicted.size();
    }
    if (!evicted.empty())
        spdlog::debug("[ImageCache] put {} evicted {} entries", key.toString(), evicted.size());
    notifyEvicted(evicted);
    return true;
}

void ImageCache::clear()
{
    std::vector<std::pair<CacheKey, ImageRef>> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_impl->clear([&dropped](const CacheKey &k, const ImageRef &v)
                      { dropped.emplace_back(k, v); });
    }
    spdlog::info("[ImageCache] Cleared {} entries", dropped.size());
    notifyEvicted(dropped);
}

void ImageCache::resize(std::size_t newCapacity)
{
    if (newCapacity == 0)
        throw ArkviewError(LoadErrorKind::InvalidCapacity, "Cache capacity must be positive.");

    std::vector<std::pair<CacheKey, ImageRef>> evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_impl->resize(newCapacity, [&evicted](const CacheKey &k, const ImageRef &v)
                       { evicted.emplace_back(k, v); });
        m_evictions += evicted.size();
    }
    spdlog::info("[ImageCache] Capacity set to {} ({} evicted)", newCapacity, evicted.size());
    notifyEvicted(evicted);
}

void ImageCache::setStrategy(CacheStrategyKind strategy)
{
    std::vector<std::pair<CacheKey, ImageRef>> evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_impl->kind() == strategy)
            return;

        auto current = m_impl->items();
        auto next = makeStrategy(strategy, m_impl->capacity());
        EvictionSink sink = [&evicted](const CacheKey &k, const ImageRef &v)
        { evicted.emplace_back(k, v); };
        for (auto &[key, image] : current)
        {
            const std::size_t bytes = image->memoryEstimate();
            next->put(key, std::move(image), bytes, sink);
        }
        spdlog::info("[ImageCache] Strategy {} -> {} ({} entries carried over)",
                     strategyName(m_impl->kind()), strategyName(strategy), next->size());
        m_impl = std::move(next);
        m_evictions += evicted.size();
    }
    notifyEvicted(evicted);
}

CacheStrategyKind ImageCache::strategy() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_impl->kind();
}

void ImageCache::setEvictionCallback(EvictionCallback cb)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onEvict = std::move(cb);
}

std::size_t ImageCache::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_impl->size();
}

std::size_t ImageCache::capacity() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_impl->capacity();
}

std::size_t ImageCache::memoryUsage() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_impl->memoryUsage();
}

bool ImageCache::contains(const CacheKey &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_impl->contains(key);
}

CacheStats ImageCache::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStats s;
    s.size = m_impl->size();
    s.capacity = m_impl->capacity();
    s.hits = m_hits;
    s.misses = m_misses;
    s.hitRate = hitRateLocked();
    s.evictions = m_evictions;
    s.memoryEstimate = m_impl->memoryUsage();
    s.strategy = m_impl->kind();
    return s;
}
