#ifndef __IMAGE_CACHE_HPP__
#define __IMAGE_CACHE_HPP__

#include "PCH.h"
#include "CacheKey.hpp"
#include "CacheStrategy.hpp"
#include "DecodedImage.hpp"

struct CacheStats
{
    std::size_t size = 0;
    std::size_t capacity = 0;
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    double hitRate = 0.0;
    std::uint64_t evictions = 0;
    std::size_t memoryEstimate = 0;
    CacheStrategyKind strategy = CacheStrategyKind::LRU;
};

/**
 * @class ImageCache
 * @brief 容量受限的 CacheKey -> 解码图像 映射
 *
 * 整个缓存只有一把锁（条目是整张解码图，规模在几十个，竞争可以接受）。
 * 淘汰策略可在构造时指定，也可运行时切换，切换时内容会被复制到新策略中。
 * 驱逐回调在锁外调用。
 */
class ImageCache
{
public:
    static constexpr std::size_t kDefaultMaxMemoryBytes = 200ull * 1024 * 1024;

    using EvictionCallback = std::function<void(const CacheKey &, const ImageRef &)>;

    /**
     * @throw ArkviewError(InvalidCapacity) 如果 capacity 为 0
     */
    explicit ImageCache(std::size_t capacity,
                        CacheStrategyKind strategy = CacheStrategyKind::LRU,
                        std::size_t maxMemoryBytes = kDefaultMaxMemoryBytes);
    ~ImageCache() = default;

    ImageCache(const ImageCache &) = delete;
    ImageCache &operator=(const ImageCache &) = delete;

    // 命中时更新 LRU 顺序 / LFU 频率，并计入命中统计
    ImageRef get(const CacheKey &key);

    // 不计统计、不影响淘汰顺序
    ImageRef peek(const CacheKey &key) const;

    /**
     * @brief 插入或替换
     * @return false 表示图像无效被拒绝（不会缓存）
     */
    bool put(const CacheKey &key, ImageRef image);

    void clear();

    /**
     * @brief 立即淘汰到新容量
     * @throw ArkviewError(InvalidCapacity) 如果 newCapacity 为 0
     */
    void resize(std::size_t newCapacity);

    void setStrategy(CacheStrategyKind strategy);
    CacheStrategyKind strategy() const;

    void setEvictionCallback(EvictionCallback cb);

    std::size_t size() const;
    std::size_t capacity() const;
    std::size_t memoryUsage() const;
    bool contains(const CacheKey &key) const;
    CacheStats stats() const;

private:
    std::unique_ptr<CacheStrategy> makeStrategy(CacheStrategyKind kind, std::size_t capacity) const;
    double hitRateLocked() const;
    void notifyEvicted(const std::vector<std::pair<CacheKey, ImageRef>> &evicted) const;

    mutable std::mutex m_mutex;
    std::unique_ptr<CacheStrategy> m_impl;
    std::size_t m_maxMemoryBytes;

    std::uint64_t m_hits = 0;
    std::uint64_t m_misses = 0;
    std::uint64_t m_evictions = 0;

    EvictionCallback m_onEvict;
};

#endif
