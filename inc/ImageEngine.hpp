#ifndef _IMAGE_ENGINE_HPP_
#define _IMAGE_ENGINE_HPP_

#include "PCH.h"
#include "AppConfig.hpp"
#include "ArchivePool.hpp"
#include "ArchiveScanner.hpp"
#include "ImageCache.hpp"
#include "ImageDecoder.hpp"
#include "LoadCoordinator.hpp"
#include "PreloadScheduler.hpp"
#include "ResultChannel.hpp"
#include "ResultRouter.hpp"
#include "WorkerPool.hpp"

/**
 * @class ImageEngine
 * @brief 应用根对象，按依赖顺序构造所有组件并注入
 *
 * 成员声明顺序即构造顺序；析构时反向进行，
 * 线程池最后析构，所有依赖它的组件都已先停下。
 */
class ImageEngine
{
public:
    explicit ImageEngine(AppConfig config);
    ~ImageEngine();

    ImageEngine(const ImageEngine &) = delete;
    ImageEngine &operator=(const ImageEngine &) = delete;

    const AppConfig &config() const
    {
        return m_config;
    }

    WorkerPool &workers()
    {
        return m_workers;
    }
    ImageCache &cache()
    {
        return m_cache;
    }
    ArchivePool &archives()
    {
        return m_archives;
    }
    ImageDecoder &decoder()
    {
        return *m_decoder;
    }
    ResultChannel &channel()
    {
        return m_channel;
    }
    ResultRouter &router()
    {
        return m_router;
    }
    LoadCoordinator &coordinator()
    {
        return m_coordinator;
    }
    PreloadScheduler &preloader()
    {
        return m_preloader;
    }
    ArchiveScanner &scanner()
    {
        return m_scanner;
    }

    // 切换缓存容量、预加载深度、大小上限和缩放质量
    void setPerformanceMode(bool enabled);
    bool performanceMode() const
    {
        return m_config.performanceMode;
    }

    // 清空缓存并关闭所有压缩包
    void clearCaches();

    // 以当前模式的参数构造请求
    LoadRequest viewerRequest(const fs::path &archive, const std::string &member) const;
    LoadRequest thumbnailRequest(const fs::path &archive, const std::string &member) const;

    // 停止扫描、撤回预加载、等待线程池排空
    void shutdown();

private:
    AppConfig m_config;
    WorkerPool m_workers;
    ImageCache m_cache;
    ArchivePool m_archives;
    std::unique_ptr<ImageDecoder> m_decoder;
    ResultChannel m_channel;
    ResultRouter m_router;
    LoadCoordinator m_coordinator;
    PreloadScheduler m_preloader;
    ArchiveScanner m_scanner;
};

#endif
