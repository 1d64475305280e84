#include "ImageEngine.hpp"

ImageEngine::ImageEngine(AppConfig config) :
    m_config(std::move(config)),
    m_workers(m_config.workerCount > 0 ? m_config.workerCount : WorkerPool::defaultThreadCount()),
    m_cache(m_config.effectiveCacheItems(), m_config.strategy, m_config.lfuMaxMemory),
    m_archives(m_config.archiveHandleBound),
    m_decoder(createDecoder(m_config.decoder)),
    m_coordinator(m_cache, m_archives, *m_decoder, m_workers, m_channel),
    m_preloader(m_coordinator, m_cache, m_config.effectivePreloadNeighbors()),
    m_scanner(m_workers, m_config.batchScanSize, m_config.batchUpdateInterval)
{
    m_preloader.setPreloadNextThumbnail(m_config.preloadNextThumbnail);
    spdlog::info("[ImageEngine] {} workers, cache {} ({}), decoder {}, performance mode {}",
                 m_workers.threadCount(), m_cache.capacity(), strategyName(m_config.strategy),
                 backendName(m_config.decoder), m_config.performanceMode ? "on" : "off");
}

ImageEngine::~ImageEngine()
{
    shutdown();
}

void ImageEngine::setPerformanceMode(bool enabled)
{
    if (m_config.performanceMode == enabled)
        return;
    m_config.performanceMode = enabled;

    m_cache.resize(m_config.effectiveCacheItems());
    m_preloader.setDepth(m_config.effectivePreloadNeighbors());
    spdlog::info("[ImageEngine] Performance mode {} (cache {}, preload depth {})",
                 enabled ? "on" : "off", m_config.effectiveCacheItems(), m_config.effectivePreloadNeighbors());
}

void ImageEngine::clearCaches()
{
    m_preloader.cancelAll();
    m_cache.clear();
    m_archives.closeAll();
}

LoadRequest ImageEngine::viewerRequest(const fs::path &archive, const std::string &member) const
{
    LoadRequest request;
    request.archive = archive;
    request.member = member;
    request.maxByteSize = m_config.effectiveMaxViewerLoad();
    request.variant = ImageVariant::original();
    request.performanceMode = m_config.performanceMode;
    return request;
}

LoadRequest ImageEngine::thumbnailRequest(const fs::path &archive, const std::string &member) const
{
    const int size = m_config.effectiveThumbnailSize();
    LoadRequest request;
    request.archive = archive;
    request.member = member;
    request.maxByteSize = m_config.effectiveMaxThumbnailLoad();
    request.variant = ImageVariant::thumbnail(size, size);
    request.performanceMode = m_config.performanceMode;
    request.cacheVariant = true;
    return request;
}

void ImageEngine::shutdown()
{
    m_scanner.stopScan();
    m_preloader.cancelAll();
    m_coordinator.waitIdle();
}
