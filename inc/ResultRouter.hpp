#ifndef _RESULT_ROUTER_HPP_
#define _RESULT_ROUTER_HPP_

#include "PCH.h"
#include "ResultChannel.hpp"

/**
 * @class ConsumerCursor
 * @brief 一个 UI 界面当前期待的键
 * 每次发出新请求时更新；结果只有与之匹配才会交给该界面。
 */
class ConsumerCursor
{
public:
    void expect(const CacheKey &key);
    void clear();
    bool matches(const CacheKey &key) const;
    std::optional<CacheKey> expected() const;

private:
    mutable std::mutex m_mutex;
    std::optional<CacheKey> m_expected;
};

/**
 * @class ResultRouter
 * @brief 把结果分发给仍然期待它的界面，过期结果直接丢弃
 *
 * cursor 以裸指针保存，界面析构前必须 detach()。
 */
class ResultRouter
{
public:
    using Handler = std::function<void(const LoadResult &)>;
    using SurfaceId = std::uint32_t;

    SurfaceId attach(std::string name, ConsumerCursor *cursor, Handler handler);
    bool detach(SurfaceId id);

    // 返回投递次数；0 表示过期结果
    std::size_t dispatch(const LoadResult &result);

    // 取空 channel 并逐个分发，返回投递总数
    std::size_t pump(ResultChannel &channel);

    std::uint64_t droppedCount() const
    {
        return m_dropped.load();
    }

private:
    struct Surface
    {
        SurfaceId id;
        std::string name;
        ConsumerCursor *cursor;
        Handler handler;
    };

    std::mutex m_surfaceMutex;
    std::vector<Surface> m_surfaces;
    SurfaceId m_nextId = 1;
    std::atomic<std::uint64_t> m_dropped{0};
};

#endif
