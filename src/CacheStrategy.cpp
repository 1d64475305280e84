#include "CacheStrategy.hpp"

const char *strategyName(CacheStrategyKind kind)
{
    switch (kind)
    {
    case CacheStrategyKind::LRU:
        return "lru";
    case CacheStrategyKind::LFU:
        return "lfu";
    case CacheStrategyKind::Adaptive:
        return "adaptive";
    }
    return "lru";
}

std::optional<CacheStrategyKind> parseStrategy(std::string_view name)
{
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(), ::tolower);
    if (lower == "lru")
        return CacheStrategyKind::LRU;
    if (lower == "lfu")
        return CacheStrategyKind::LFU;
    if (lower == "adaptive")
        return CacheStrategyKind::Adaptive;
    return std::nullopt;
}

// ==========================================
// LRU
// ==========================================

LruStrategy::LruStrategy(std::size_t capacity) : m_capacity(capacity)
{
}

ImageRef LruStrategy::get(const CacheKey &key)
{
    auto it = m_map.find(key);
    if (it == m_map.end())
        return nullptr;
    m_lruList.splice(m_lruList.begin(), m_lruList, it->second.lruIt);
    return it->second.image;
}

ImageRef LruStrategy::peek(const CacheKey &key) const
{
    auto it = m_map.find(key);
    return it != m_map.end() ? it->second.image : nullptr;
}

void LruStrategy::put(const CacheKey &key, ImageRef image, std::size_t bytes, const EvictionSink &onEvict)
{
    auto it = m_map.find(key);
    if (it != m_map.end())
    {
        // 原地替换，不重复计数
        m_memoryUsage = m_memoryUsage - it->second.bytes + bytes;
        it->second.image = std::move(image);
        it->second.bytes = bytes;
        m_lruList.splice(m_lruList.begin(), m_lruList, it->second.lruIt);
        return;
    }

    while (!m_map.empty() && m_map.size() >= m_capacity)
        evictOldest(onEvict);

    m_lruList.push_front(key);
    m_map[key] = {std::move(image), bytes, m_lruList.begin()};
    m_memoryUsage += bytes;
}

void LruStrategy::evictOldest(const EvictionSink &onEvict)
{
    if (m_lruList.empty())
        return;

    CacheKey keyToRemove = m_lruList.back();
    m_lruList.pop_back();
    auto it = m_map.find(keyToRemove);
    if (it == m_map.end())
        return;

    ImageRef evicted = std::move(it->second.image);
    m_memoryUsage -= it->second.bytes;
    m_map.erase(it);
    if (onEvict)
        onEvict(keyToRemove, evicted);
}

void LruStrategy::resize(std::size_t capacity, const EvictionSink &onEvict)
{
    m_capacity = capacity;
    while (m_map.size() > m_capacity)
        evictOldest(onEvict);
}

void LruStrategy::clear(const EvictionSink &onEvict)
{
    if (onEvict)
    {
        for (const auto &key : m_lruList)
            onEvict(key, m_map[key].image);
    }
    m_map.clear();
    m_lruList.clear();
    m_memoryUsage = 0;
}

bool LruStrategy::contains(const CacheKey &key) const
{
    return m_map.contains(key);
}

std::vector<std::pair<CacheKey, ImageRef>> LruStrategy::items() const
{
    std::vector<std::pair<CacheKey, ImageRef>> out;
    out.reserve(m_map.size());
    for (auto it = m_lruList.rbegin(); it != m_lruList.rend(); ++it)
        out.emplace_back(*it, m_map.at(*it).image);
    return out;
}

// ==========================================
// LFU
// ==========================================

LfuStrategy::LfuStrategy(std::size_t capacity, std::size_t maxMemoryBytes) :
    m_capacity(capacity), m_maxMemoryBytes(maxMemoryBytes)
{
}

void LfuStrategy::touch(const CacheKey &key)
{
    auto &entry = m_map.at(key);
    auto bucket = m_buckets.find(entry.frequency);
    bucket->second.erase(entry.bucketIt);
    if (bucket->second.empty())
        m_buckets.erase(bucket);

    ++entry.frequency;
    auto &next = m_buckets[entry.frequency];
    entry.bucketIt = next.insert(next.end(), key);
}

ImageRef LfuStrategy::get(const CacheKey &key)
{
    auto it = m_map.find(key);
    if (it == m_map.end())
        return nullptr;
    touch(key);
    return it->second.image;
}

ImageRef LfuStrategy::peek(const CacheKey &key) const
{
    auto it = m_map.find(key);
    return it != m_map.end() ? it->second.image : nullptr;
}

bool LfuStrategy::evictOne(const EvictionSink &onEvict, const CacheKey *exclude)
{
    for (auto bucket = m_buckets.begin(); bucket != m_buckets.end(); ++bucket)
    {
        for (auto keyIt = bucket->second.begin(); keyIt != bucket->second.end(); ++keyIt)
        {
            if (exclude && *keyIt == *exclude)
                continue;

            CacheKey keyToRemove = *keyIt;
            bucket->second.erase(keyIt);
            if (bucket->second.empty())
                m_buckets.erase(bucket);

            auto it = m_map.find(keyToRemove);
            ImageRef evicted = std::move(it->second.image);
            m_memoryUsage -= it->second.bytes;
            m_map.erase(it);
            if (onEvict)
                onEvict(keyToRemove, evicted);
            return true;
        }
    }
    return false;
}

void LfuStrategy::put(const CacheKey &key, ImageRef image, std::size_t bytes, const EvictionSink &onEvict)
{
    auto existing = m_map.find(key);
    std::size_t ownBytes = existing != m_map.end() ? existing->second.bytes : 0;

    // 字节上限：插入之前先腾空间
    while (m_memoryUsage - ownBytes + bytes > m_maxMemoryBytes)
    {
        if (!evictOne(onEvict, existing != m_map.end() ? &key : nullptr))
            break;
    }
    if (bytes > m_maxMemoryBytes)
        spdlog::warn("[ImageCache] Entry {} ({} bytes) exceeds the LFU memory ceiling on its own", key.toString(), bytes);

    existing = m_map.find(key);
    if (existing != m_map.end())
    {
        m_memoryUsage = m_memoryUsage - existing->second.bytes + bytes;
        existing->second.image = std::move(image);
        existing->second.bytes = bytes;
        touch(key);
        return;
    }

    while (!m_map.empty() && m_map.size() >= m_capacity)
    {
        if (!evictOne(onEvict))
            break;
    }

    auto &bucket = m_buckets[1];
    Entry entry;
    entry.image = std::move(image);
    entry.bytes = bytes;
    entry.frequency = 1;
    entry.bucketIt = bucket.insert(bucket.end(), key);
    m_map.emplace(key, std::move(entry));
    m_memoryUsage += bytes;
}

void LfuStrategy::resize(std::size_t capacity, const EvictionSink &onEvict)
{
    m_capacity = capacity;
    while (m_map.size() > m_capacity)
    {
        if (!evictOne(onEvict))
            break;
    }
}

void LfuStrategy::clear(const EvictionSink &onEvict)
{
    if (onEvict)
    {
        for (const auto &[key, entry] : m_map)
            onEvict(key, entry.image);
    }
    m_map.clear();
    m_buckets.clear();
    m_memoryUsage = 0;
}

bool LfuStrategy::contains(const CacheKey &key) const
{
    return m_map.contains(key);
}

std::size_t LfuStrategy::frequencyOf(const CacheKey &key) const
{
    auto it = m_map.find(key);
    return it != m_map.end() ? it->second.frequency : 0;
}

std::vector<std::pair<CacheKey, ImageRef>> LfuStrategy::items() const
{
    std::vector<std::pair<CacheKey, ImageRef>> out;
    out.reserve(m_map.size());
    for (const auto &[freq, keys] : m_buckets)
    {
        for (const auto &key : keys)
            out.emplace_back(key, m_map.at(key).image);
    }
    return out;
}

// ==========================================
// Adaptive LRU
// ==========================================

AdaptiveLruStrategy::AdaptiveLruStrategy(std::size_t capacity, std::size_t minCapacity, std::size_t maxCapacity) :
    LruStrategy(capacity), m_minCapacity(minCapacity), m_maxCapacity(maxCapacity)
{
}

void AdaptiveLruStrategy::observeHitRate(double hitRate, const EvictionSink &onEvict)
{
    m_recentHitRates.push_back(hitRate);
    while (m_recentHitRates.size() > kWindow)
        m_recentHitRates.pop_front();

    ++m_observations;
    if (m_observations % kAdjustEvery != 0 || m_recentHitRates.size() < kWindow)
        return;

    double sum = 0.0;
    for (double rate : m_recentHitRates)
        sum += rate;
    const double avgHitRate = sum / static_cast<double>(m_recentHitRates.size());

    if (avgHitRate < kGrowBelow && m_capacity < m_maxCapacity)
    {
        std::size_t newCapacity = std::min(m_capacity + kStep, m_maxCapacity);
        spdlog::debug("[ImageCache] Adaptive grow {} -> {} (hit rate {:.2f})", m_capacity, newCapacity, avgHitRate);
        resize(newCapacity, onEvict);
    }
    else if (avgHitRate > kShrinkAbove && m_capacity > m_minCapacity)
    {
        std::size_t newCapacity = m_capacity > m_minCapacity + kStep ? m_capacity - kStep : m_minCapacity;
        spdlog::debug("[ImageCache] Adaptive shrink {} -> {} (hit rate {:.2f})", m_capacity, newCapacity, avgHitRate);
        resize(newCapacity, onEvict);
    }
}
