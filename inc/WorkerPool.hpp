#ifndef WORKERPOOL_HPP
#define WORKERPOOL_HPP

#include "PCH.h"

// 引入 BS::thread_pool 库 (v5, 启用优先级)
#include "BS_thread_pool.hpp"

enum class TaskPriority : std::uint8_t
{
    High, // 用户请求
    Low   // 预加载 / 扫描
};

/**
 * @class WorkerPool
 * @brief 固定大小的优先级线程池
 *
 * 默认线程数为 min(8, CPU + 4)，至少 2 个。
 * 高优先级任务总是先于队列中的低优先级任务被取出。
 */
class WorkerPool
{
public:
    static std::size_t defaultThreadCount()
    {
        const std::size_t cpu = std::thread::hardware_concurrency();
        return std::min<std::size_t>(8, cpu + 4);
    }

    explicit WorkerPool(std::size_t threads = defaultThreadCount()) :
        m_pool(threads < 2 ? 2 : threads)
    {
    }

    // 禁止拷贝和移动
    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /**
     * @brief 提交任务
     *
     * submit_task 要求无参可调用对象，这里用 std::bind 绑定参数。
     * @return std::future<返回值类型>
     */
    template <class F, class... Args>
    auto enqueue(TaskPriority priority, F &&f, Args &&...args)
    {
        return m_pool.submit_task(std::bind(std::forward<F>(f), std::forward<Args>(args)...),
                                  toNative(priority));
    }

    // 不需要返回值的任务
    template <class F>
    void detach(TaskPriority priority, F &&f)
    {
        m_pool.detach_task(std::forward<F>(f), toNative(priority));
    }

    // 等待所有任务完成
    void waitIdle()
    {
        m_pool.wait();
    }

    std::size_t threadCount() const
    {
        return m_pool.get_thread_count();
    }

    std::size_t queuedTasks() const
    {
        return m_pool.get_tasks_queued();
    }

    ~WorkerPool()
    {
        // 析构时等待所有任务完成
        waitIdle();
    }

private:
    static BS::priority_t toNative(TaskPriority priority)
    {
        return priority == TaskPriority::High ? BS::pr::high : BS::pr::low;
    }

    BS::thread_pool<BS::tp::priority> m_pool;
};

#endif
