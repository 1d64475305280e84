#include "AppConfig.hpp"

#include <QCommandLineParser>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace
{

void readSize(const QJsonObject &obj, const char *name, std::size_t &field)
{
    auto v = obj.value(QLatin1String(name));
    if (v.isDouble() && v.toDouble() >= 0)
        field = static_cast<std::size_t>(v.toDouble());
}

void readInt(const QJsonObject &obj, const char *name, int &field)
{
    auto v = obj.value(QLatin1String(name));
    if (v.isDouble())
        field = v.toInt();
}

void readBool(const QJsonObject &obj, const char *name, bool &field)
{
    auto v = obj.value(QLatin1String(name));
    if (v.isBool())
        field = v.toBool();
}

} // namespace

fs::path AppConfig::defaultConfigPath()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (dir.isEmpty())
        return fs::path("settings.json");
    return fs::path(dir.toStdString()) / "settings.json";
}

void AppConfig::applyJson(const QJsonObject &obj)
{
    readInt(obj, "thumbnailSize", thumbnailSize);
    readInt(obj, "thumbnailSizePerformance", thumbnailSizePerf);
    readSize(obj, "maxThumbnailLoad", maxThumbnailLoad);
    readSize(obj, "maxThumbnailLoadPerformance", maxThumbnailLoadPerf);
    readSize(obj, "maxViewerLoad", maxViewerLoad);
    readSize(obj, "maxViewerLoadPerformance", maxViewerLoadPerf);
    readSize(obj, "cacheItems", cacheItems);
    readSize(obj, "cacheItemsPerformance", cacheItemsPerf);
    readSize(obj, "preloadNeighbors", preloadNeighbors);
    readSize(obj, "preloadNeighborsPerformance", preloadNeighborsPerf);
    readBool(obj, "preloadNextThumbnail", preloadNextThumbnail);
    readSize(obj, "batchScanSize", batchScanSize);
    readSize(obj, "batchUpdateInterval", batchUpdateInterval);
    readSize(obj, "workerCount", workerCount);
    readSize(obj, "archiveHandleBound", archiveHandleBound);
    readSize(obj, "lfuMaxMemory", lfuMaxMemory);
    readInt(obj, "pumpIntervalMs", pumpIntervalMs);
    readBool(obj, "performanceMode", performanceMode);

    auto s = obj.value(QLatin1String("cacheStrategy"));
    if (s.isString())
    {
        if (auto parsed = parseStrategy(s.toString().toStdString()))
            strategy = *parsed;
        else
            spdlog::warn("[AppConfig] Unknown cacheStrategy '{}', keeping {}", s.toString().toStdString(), strategyName(strategy));
    }

    auto d = obj.value(QLatin1String("decoder"));
    if (d.isString())
    {
        if (auto parsed = parseBackend(d.toString().toStdString()))
            decoder = *parsed;
        else
            spdlog::warn("[AppConfig] Unknown decoder '{}', keeping {}", d.toString().toStdString(), backendName(decoder));
    }
}

QJsonObject AppConfig::toJson() const
{
    QJsonObject obj;
    obj["thumbnailSize"] = thumbnailSize;
    obj["thumbnailSizePerformance"] = thumbnailSizePerf;
    obj["maxThumbnailLoad"] = static_cast<qint64>(maxThumbnailLoad);
    obj["maxThumbnailLoadPerformance"] = static_cast<qint64>(maxThumbnailLoadPerf);
    obj["maxViewerLoad"] = static_cast<qint64>(maxViewerLoad);
    obj["maxViewerLoadPerformance"] = static_cast<qint64>(maxViewerLoadPerf);
    obj["cacheItems"] = static_cast<qint64>(cacheItems);
    obj["cacheItemsPerformance"] = static_cast<qint64>(cacheItemsPerf);
    obj["preloadNeighbors"] = static_cast<qint64>(preloadNeighbors);
    obj["preloadNeighborsPerformance"] = static_cast<qint64>(preloadNeighborsPerf);
    obj["preloadNextThumbnail"] = preloadNextThumbnail;
    obj["batchScanSize"] = static_cast<qint64>(batchScanSize);
    obj["batchUpdateInterval"] = static_cast<qint64>(batchUpdateInterval);
    obj["workerCount"] = static_cast<qint64>(workerCount);
    obj["archiveHandleBound"] = static_cast<qint64>(archiveHandleBound);
    obj["lfuMaxMemory"] = static_cast<qint64>(lfuMaxMemory);
    obj["cacheStrategy"] = QString::fromLatin1(strategyName(strategy));
    obj["decoder"] = QString::fromLatin1(backendName(decoder));
    obj["pumpIntervalMs"] = pumpIntervalMs;
    obj["performanceMode"] = performanceMode;
    return obj;
}

AppConfig AppConfig::loadFromFile(const fs::path &path)
{
    AppConfig config;
    QFile file(QString::fromStdString(path.string()));
    if (!file.exists())
    {
        spdlog::warn("[AppConfig] {} not found, using defaults", path.string());
        return config;
    }
    if (!file.open(QIODevice::ReadOnly))
    {
        spdlog::warn("[AppConfig] Cannot read {}, using defaults", path.string());
        return config;
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
    {
        spdlog::warn("[AppConfig] Invalid settings file {} ({}), using defaults",
                     path.string(), err.errorString().toStdString());
        return config;
    }

    config.applyJson(doc.object());
    return config;
}

bool AppConfig::saveToFile(const fs::path &path) const
{
    std::error_code ec;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path(), ec);

    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
    {
        spdlog::error("[AppConfig] Cannot write {}", path.string());
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    return true;
}

AppConfig::ParseResult AppConfig::fromArguments(const QStringList &arguments, AppConfig &out, QString &message)
{
    QCommandLineParser parser;
    parser.setApplicationDescription("Arkview - browse image-only ZIP archives");
    parser.addHelpOption();

    QCommandLineOption rootDirOpt("root-dir", "Directory to scan for ZIP archives.", "path");
    QCommandLineOption perfOpt("performance", "Start in performance mode.");
    QCommandLineOption strategyOpt("strategy", "Cache strategy: lru, lfu or adaptive.", "name");
    QCommandLineOption decoderOpt("decoder", "Decoder backend: opencv or stb.", "name");
    QCommandLineOption cacheSizeOpt("cache-size", "Cache capacity in images.", "n");
    QCommandLineOption configOpt("config", "Settings file to load.", "file");
    QCommandLineOption verboseOpt("verbose", "Enable debug logging.");
    parser.addOptions({rootDirOpt, perfOpt, strategyOpt, decoderOpt, cacheSizeOpt, configOpt, verboseOpt});

    if (!parser.parse(arguments))
    {
        message = parser.errorText();
        return ParseResult::Error;
    }
    if (parser.isSet("help"))
    {
        message = parser.helpText();
        return ParseResult::HelpRequested;
    }

    const fs::path configPath = parser.isSet(configOpt) ? fs::path(parser.value(configOpt).toStdString())
                                                        : defaultConfigPath();
    AppConfig config = loadFromFile(configPath);

    if (parser.isSet(rootDirOpt))
        config.rootDir = parser.value(rootDirOpt).toStdString();
    if (parser.isSet(perfOpt))
        config.performanceMode = true;
    if (parser.isSet(verboseOpt))
        config.verbose = true;

    if (parser.isSet(strategyOpt))
    {
        auto parsed = parseStrategy(parser.value(strategyOpt).toStdString());
        if (!parsed)
        {
            message = QString("Unknown cache strategy: %1").arg(parser.value(strategyOpt));
            return ParseResult::Error;
        }
        config.strategy = *parsed;
    }

    if (parser.isSet(decoderOpt))
    {
        auto parsed = parseBackend(parser.value(decoderOpt).toStdString());
        if (!parsed)
        {
            message = QString("Unknown decoder: %1").arg(parser.value(decoderOpt));
            return ParseResult::Error;
        }
        config.decoder = *parsed;
    }

    if (parser.isSet(cacheSizeOpt))
    {
        bool ok = false;
        const qulonglong n = parser.value(cacheSizeOpt).toULongLong(&ok);
        if (!ok || n == 0)
        {
            message = QString("Invalid cache size: %1").arg(parser.value(cacheSizeOpt));
            return ParseResult::Error;
        }
        config.cacheItems = static_cast<std::size_t>(n);
    }

    out = std::move(config);
    return ParseResult::Ok;
}
