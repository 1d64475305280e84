#ifndef _CACHE_STRATEGY_HPP_
#define _CACHE_STRATEGY_HPP_

#include "CacheKey.hpp"
#include "DecodedImage.hpp"
#include "PCH.h"

enum class CacheStrategyKind : std::uint8_t
{
    LRU,
    LFU,
    Adaptive
};

const char *strategyName(CacheStrategyKind kind);
std::optional<CacheStrategyKind> parseStrategy(std::string_view name);

// 被驱逐条目的收集器，由 ImageCache 提供
using EvictionSink = std::function<void(const CacheKey &, const ImageRef &)>;

/**
 * @class CacheStrategy
 * @brief 淘汰策略的抽象接口
 *
 * 策略对象自己持有条目和访问顺序，但不加锁：
 * 所有调用都发生在 ImageCache 的那一把锁之内。
 */
class CacheStrategy
{
public:
    virtual ~CacheStrategy() = default;

    virtual CacheStrategyKind kind() const = 0;

    // 命中时更新访问顺序/频率
    virtual ImageRef get(const CacheKey &key) = 0;
    // 只读查询，不影响淘汰顺序
    virtual ImageRef peek(const CacheKey &key) const = 0;

    virtual void put(const CacheKey &key, ImageRef image, std::size_t bytes, const EvictionSink &onEvict) = 0;
    virtual void resize(std::size_t capacity, const EvictionSink &onEvict) = 0;
    virtual void clear(const EvictionSink &onEvict) = 0;

    virtual bool contains(const CacheKey &key) const = 0;
    virtual std::size_t size() const = 0;
    virtual std::size_t capacity() const = 0;
    virtual std::size_t memoryUsage() const = 0;

    /**
     * @brief 按 "最先被淘汰 -> 最后被淘汰" 的顺序导出全部条目
     * 切换策略时按此顺序重新插入，尽量保留原有的冷热关系。
     */
    virtual std::vector<std::pair<CacheKey, ImageRef>> items() const = 0;

    // 每次 put 之前由 ImageCache 通知当前命中率，仅自适应策略关心
    virtual void observeHitRate(double hitRate, const EvictionSink &onEvict)
    {
    }
};

class LruStrategy : public CacheStrategy
{
public:
    explicit LruStrategy(std::size_t capacity);

    CacheStrategyKind kind() const override
    {
        return CacheStrategyKind::LRU;
    }

    ImageRef get(const CacheKey &key) override;
    ImageRef peek(const CacheKey &key) const override;
    void put(const CacheKey &key, ImageRef image, std::size_t bytes, const EvictionSink &onEvict) override;
    void resize(std::size_t capacity, const EvictionSink &onEvict) override;
    void clear(const EvictionSink &onEvict) override;

    bool contains(const CacheKey &key) const override;
    std::size_t size() const override
    {
        return m_map.size();
    }
    std::size_t capacity() const override
    {
        return m_capacity;
    }
    std::size_t memoryUsage() const override
    {
        return m_memoryUsage;
    }
    std::vector<std::pair<CacheKey, ImageRef>> items() const override;

protected:
    void evictOldest(const EvictionSink &onEvict);

    std::size_t m_capacity;
    std::size_t m_memoryUsage = 0;

    // front = 最近使用, back = 最久未使用
    std::list<CacheKey> m_lruList;
    struct Entry
    {
        ImageRef image;
        std::size_t bytes = 0;
        std::list<CacheKey>::iterator lruIt;
    };
    std::unordered_map<CacheKey, Entry> m_map;
};

/**
 * @class LfuStrategy
 * @brief 频率桶 LFU，附带字节上限
 *
 * 淘汰最低非空频率桶里最早插入的键。
 * 插入前若 "当前内存 + 新条目" 超过字节上限，先淘汰到放得下为止，
 * 与条目数上限相互独立。
 */
class LfuStrategy : public CacheStrategy
{
public:
    LfuStrategy(std::size_t capacity, std::size_t maxMemoryBytes);

    CacheStrategyKind kind() const override
    {
        return CacheStrategyKind::LFU;
    }

    ImageRef get(const CacheKey &key) override;
    ImageRef peek(const CacheKey &key) const override;
    void put(const CacheKey &key, ImageRef image, std::size_t bytes, const EvictionSink &onEvict) override;
    void resize(std::size_t capacity, const EvictionSink &onEvict) override;
    void clear(const EvictionSink &onEvict) override;

    bool contains(const CacheKey &key) const override;
    std::size_t size() const override
    {
        return m_map.size();
    }
    std::size_t capacity() const override
    {
        return m_capacity;
    }
    std::size_t memoryUsage() const override
    {
        return m_memoryUsage;
    }
    std::size_t maxMemoryBytes() const
    {
        return m_maxMemoryBytes;
    }
    std::vector<std::pair<CacheKey, ImageRef>> items() const override;

    // 测试与诊断用
    std::size_t frequencyOf(const CacheKey &key) const;

private:
    void touch(const CacheKey &key);
    bool evictOne(const EvictionSink &onEvict, const CacheKey *exclude = nullptr);

    std::size_t m_capacity;
    std::size_t m_maxMemoryBytes;
    std::size_t m_memoryUsage = 0;

    struct Entry
    {
        ImageRef image;
        std::size_t bytes = 0;
        std::size_t frequency = 1;
        std::list<CacheKey>::iterator bucketIt;
    };
    std::unordered_map<CacheKey, Entry> m_map;
    // frequency -> 按插入先后排列的键；空桶会被立即删除，begin() 即最低频率
    std::map<std::size_t, std::list<CacheKey>> m_buckets;
};

/**
 * @class AdaptiveLruStrategy
 * @brief 根据近期命中率自动伸缩容量的 LRU
 *
 * 每次 put 记录一次命中率，每 kAdjustEvery 次 put 取最近 kWindow 次的平均值：
 * 低于 kGrowBelow 时扩容 kStep（不超过上限），高于 kShrinkAbove 时缩容 kStep（不低于下限）。
 */
class AdaptiveLruStrategy : public LruStrategy
{
public:
    static constexpr std::size_t kStep = 5;
    static constexpr std::size_t kWindow = 5;
    static constexpr std::size_t kAdjustEvery = 10;
    static constexpr double kGrowBelow = 0.7;
    static constexpr double kShrinkAbove = 0.9;

    AdaptiveLruStrategy(std::size_t capacity, std::size_t minCapacity = 10, std::size_t maxCapacity = 200);

    CacheStrategyKind kind() const override
    {
        return CacheStrategyKind::Adaptive;
    }

    void observeHitRate(double hitRate, const EvictionSink &onEvict) override;

    std::size_t minCapacity() const
    {
        return m_minCapacity;
    }
    std::size_t maxCapacity() const
    {
        return m_maxCapacity;
    }

private:
    std::size_t m_minCapacity;
    std::size_t m_maxCapacity;
    std::size_t m_observations = 0;
    std::deque<double> m_recentHitRates;
};

#endif
