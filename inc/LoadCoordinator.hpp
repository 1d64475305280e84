#ifndef __LOAD_COORDINATOR_HPP__
#define __LOAD_COORDINATOR_HPP__

#include "PCH.h"
#include "ArchivePool.hpp"
#include "ImageCache.hpp"
#include "ImageDecoder.hpp"
#include "LoadTypes.hpp"
#include "ResultChannel.hpp"
#include "WorkerPool.hpp"

// 一次实际派发的加载任务，多个请求可以共享它
struct LoadJob
{
    LoadRequest request;
    CacheKey key;
    std::promise<LoadResult> promise;
    std::shared_future<LoadResult> future;
    std::atomic<int> waiters{1};
    ImageRef original; // 已缓存的原图，可为空

    // 以下受 LoadCoordinator::m_mutex 保护
    bool started = false;  // 已被某个 runner 认领，其余 runner 直接返回
    bool promoted = false; // 预加载任务已补派过一个高优先级 runner
};

/**
 * @class LoadTicket
 * @brief 一次 submit 的句柄
 * 拷贝共享同一个撤回标记，cancel() 只会撤回一次。
 */
class LoadTicket
{
public:
    LoadTicket() = default;

    bool valid() const
    {
        return m_future.valid();
    }
    const CacheKey &key() const
    {
        return m_key;
    }

    bool ready() const;
    bool waitFor(std::chrono::milliseconds timeout) const;

    // 阻塞直到结果可用
    LoadResult get() const;

    std::shared_future<LoadResult> future() const
    {
        return m_future;
    }

    // 撤回本等待者；没有等待者且任务未开始时，任务以 Cancelled 结束
    void cancel();
    bool cancelled() const;

private:
    friend class LoadCoordinator;
    LoadTicket(CacheKey key, std::shared_future<LoadResult> future, std::shared_ptr<LoadJob> job);

    CacheKey m_key;
    std::shared_future<LoadResult> m_future;
    std::shared_ptr<LoadJob> m_job;
    std::shared_ptr<std::atomic<bool>> m_withdrawn;
};

/**
 * @class LoadCoordinator
 * @brief 请求 -> 缓存检查 -> 派发解码 -> 入缓存 -> 投递结果
 *
 * 同一个键同时只会有一个任务在跑，后来的请求（包括 forceReload）挂到同一个 future 上。
 * 缓存命中同样通过 ResultChannel 投递，UI 只有一条接收路径。
 * 工作线程里的任何异常都转换成 LoadResult，不会跨越线程边界。
 */
class LoadCoordinator
{
public:
    LoadCoordinator(ImageCache &cache, ArchivePool &archives, ImageDecoder &decoder,
                    WorkerPool &workers, ResultChannel &channel);
    ~LoadCoordinator();

    LoadCoordinator(const LoadCoordinator &) = delete;
    LoadCoordinator &operator=(const LoadCoordinator &) = delete;

    /**
     * @throw ArkviewError(InvalidCapacity) 如果 maxByteSize 为 0
     */
    LoadTicket submit(LoadRequest request);

    bool isInFlight(const CacheKey &key) const;
    std::size_t inFlightCount() const;

    // 阻塞直到线程池空闲
    void waitIdle();

    ImageCache &cache()
    {
        return m_cache;
    }

private:
    LoadTicket deliverNow(const CacheKey &key, ImageRef image);
    bool attachLocked(LoadJob &job, const LoadRequest &request);
    void dispatch(const std::shared_ptr<LoadJob> &job, TaskPriority priority);
    void runJob(const std::shared_ptr<LoadJob> &job);
    void finish(const std::shared_ptr<LoadJob> &job, LoadResult result, bool post);
    LoadResult execute(const LoadRequest &request, const CacheKey &key, ImageRef original);

    ImageCache &m_cache;
    ArchivePool &m_archives;
    ImageDecoder &m_decoder;
    WorkerPool &m_workers;
    ResultChannel &m_channel;

    mutable std::mutex m_mutex;
    std::unordered_map<CacheKey, std::shared_ptr<LoadJob>> m_inFlight;
};

#endif
