#include "ResultChannel.hpp"

void ResultChannel::post(LoadResult result)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(std::move(result));
    }
    m_cv.notify_all();
}

std::vector<LoadResult> ResultChannel::drain()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<LoadResult> out;
    out.reserve(m_queue.size());
    while (!m_queue.empty())
    {
        out.push_back(std::move(m_queue.front()));
        m_queue.pop_front();
    }
    return out;
}

std::size_t ResultChannel::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool ResultChannel::waitFor(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this]
                         { return !m_queue.empty(); });
}
