#ifndef _PRELOAD_SCHEDULER_HPP_
#define _PRELOAD_SCHEDULER_HPP_

#include "PCH.h"
#include "LoadCoordinator.hpp"

/**
 * @class PreloadScheduler
 * @brief 为当前图片的邻居发出低优先级请求
 *
 * 已缓存或正在加载的键不会重复请求；同时挂起的预加载票据不超过 maxQueued。
 */
class PreloadScheduler
{
public:
    static constexpr std::size_t kDefaultDepth = 2;
    static constexpr std::size_t kDefaultMaxQueued = 4;

    PreloadScheduler(LoadCoordinator &coordinator, ImageCache &cache,
                     std::size_t depth = kDefaultDepth, std::size_t maxQueued = kDefaultMaxQueued);
    ~PreloadScheduler();

    /**
     * @brief 预加载 currentIndex 两侧的成员
     * Forward 先看后面再看前面，Backward 相反。
     * @return 实际发出的请求数
     */
    std::size_t schedule(const fs::path &archive, const std::vector<std::string> &members,
                         std::size_t currentIndex, Direction direction,
                         const ImageVariant &variant, std::size_t maxByteSize, bool performanceMode = false);

    // 预加载下一个压缩包的封面缩略图
    bool scheduleNextCover(const fs::path &nextArchive, const std::string &firstMember,
                           int thumbSize, std::size_t maxByteSize, bool performanceMode = false);

    void cancelAll();

    void setDepth(std::size_t depth);
    std::size_t depth() const;

    void setPreloadNextThumbnail(bool enabled);
    bool preloadNextThumbnail() const;

    std::size_t outstanding();

private:
    void pruneFinishedLocked();
    bool issueLocked(LoadRequest request);

    LoadCoordinator &m_coordinator;
    ImageCache &m_cache;

    mutable std::mutex m_mutex;
    std::size_t m_depth;
    std::size_t m_maxQueued;
    bool m_preloadNextThumbnail = true;
    std::vector<LoadTicket> m_tickets;
};

#endif
