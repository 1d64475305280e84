#ifndef _APP_CONFIG_HPP_
#define _APP_CONFIG_HPP_

#include "PCH.h"
#include "CacheStrategy.hpp"
#include "ImageDecoder.hpp"

#include <QJsonObject>
#include <QStringList>

/**
 * @brief 运行参数
 * 默认值 <- settings.json <- 命令行，后者覆盖前者。
 * 带 Perf 后缀的字段是性能模式下的取值，由 effective*() 选择。
 */
struct AppConfig
{
    static constexpr std::size_t MiB = 1024 * 1024;

    int thumbnailSize = 280;
    int thumbnailSizePerf = 180;
    std::size_t maxThumbnailLoad = 10 * MiB;
    std::size_t maxThumbnailLoadPerf = 3 * MiB;
    std::size_t maxViewerLoad = 100 * MiB;
    std::size_t maxViewerLoadPerf = 30 * MiB;
    std::size_t cacheItems = 50;
    std::size_t cacheItemsPerf = 25;
    std::size_t preloadNeighbors = 2;
    std::size_t preloadNeighborsPerf = 1;
    bool preloadNextThumbnail = true;

    std::size_t batchScanSize = 50;
    std::size_t batchUpdateInterval = 20;
    std::size_t workerCount = 0; // 0 = min(8, CPU + 4)
    std::size_t archiveHandleBound = 10;
    std::size_t lfuMaxMemory = 200 * MiB;

    CacheStrategyKind strategy = CacheStrategyKind::LRU;
    DecoderBackend decoder = DecoderBackend::OpenCV;
    int pumpIntervalMs = 30;
    bool performanceMode = false;

    // 仅来自命令行
    std::string rootDir;
    bool verbose = false;

    int effectiveThumbnailSize() const
    {
        return performanceMode ? thumbnailSizePerf : thumbnailSize;
    }
    std::size_t effectiveMaxThumbnailLoad() const
    {
        return performanceMode ? maxThumbnailLoadPerf : maxThumbnailLoad;
    }
    std::size_t effectiveMaxViewerLoad() const
    {
        return performanceMode ? maxViewerLoadPerf : maxViewerLoad;
    }
    std::size_t effectiveCacheItems() const
    {
        return performanceMode ? cacheItemsPerf : cacheItems;
    }
    std::size_t effectivePreloadNeighbors() const
    {
        return performanceMode ? preloadNeighborsPerf : preloadNeighbors;
    }

    // <AppConfigLocation>/settings.json
    static fs::path defaultConfigPath();

    // 文件不存在或格式错误时返回默认值并记录警告
    static AppConfig loadFromFile(const fs::path &path);
    bool saveToFile(const fs::path &path) const;

    void applyJson(const QJsonObject &obj);
    QJsonObject toJson() const;

    enum class ParseResult
    {
        Ok,
        Error,
        HelpRequested
    };

    /**
     * @brief 解析命令行（含 --config 指定的配置文件）
     * @param message 出错时为错误信息，HelpRequested 时为帮助文本
     */
    static ParseResult fromArguments(const QStringList &arguments, AppConfig &out, QString &message);
};

#endif
