#ifndef _RESULT_CHANNEL_HPP_
#define _RESULT_CHANNEL_HPP_

#include "PCH.h"
#include "LoadTypes.hpp"

/**
 * @class ResultChannel
 * @brief 工作线程 -> UI 线程的结果队列 (FIFO)
 * 工作线程 post，UI 线程定时 drain。
 */
class ResultChannel
{
public:
    void post(LoadResult result);

    // 取走当前所有结果
    std::vector<LoadResult> drain();

    std::size_t size() const;

    // 等到队列非空或超时；返回队列是否非空
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    std::deque<LoadResult> m_queue;
};

#endif
