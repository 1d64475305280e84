#include "PCH.h"
#include "AppConfig.hpp"
#include "ArchiveNavigator.hpp"
#include "ImageEngine.hpp"
#include "RawTerminal.hpp"
#include "ResultPump.hpp"

#include <QCoreApplication>
#include <QMetaObject>

// =========================================================
//  Terminal session: viewer + gallery surfaces
// =========================================================
class TerminalSession
{
public:
    explicit TerminalSession(ImageEngine &engine) : m_engine(engine)
    {
        m_viewerId = m_engine.router().attach("viewer", &m_viewerCursor, [](const LoadResult &r)
                                              { printResult("viewer", r); });
        m_galleryId = m_engine.router().attach("gallery", &m_galleryCursor, [](const LoadResult &r)
                                               { printResult("gallery", r); });
    }

    ~TerminalSession()
    {
        m_engine.router().detach(m_viewerId);
        m_engine.router().detach(m_galleryId);
    }

    void setArchives(std::vector<ArchiveInfo> archives)
    {
        m_navigator.setArchives(std::move(archives));
        for (const auto &info : m_navigator.archives())
            std::cout << "  " << info.path << " (" << info.imageCount << " images)\n";
    }

    void start()
    {
        show(m_navigator.next(), false);
    }

    void onKey(int c)
    {
        switch (c)
        {
        case '.':
            show(m_navigator.next(), false);
            break;
        case ',':
            show(m_navigator.prev(), false);
            break;
        case ']':
            show(m_navigator.nextArchive(), false);
            break;
        case '[':
            show(m_navigator.prevArchive(), false);
            break;
        case 'f':
            show(m_navigator.current(), true);
            break;
        case 't':
            requestCover();
            break;
        case 'm':
            m_engine.setPerformanceMode(!m_engine.performanceMode());
            std::cout << "> Performance mode " << (m_engine.performanceMode() ? "on" : "off") << '\n';
            break;
        case 's':
            printStats();
            break;
        case 'c':
            m_engine.clearCaches();
            std::cout << "> Caches cleared\n";
            break;
        default:
            break;
        }
    }

private:
    static void printResult(const char *surface, const LoadResult &r)
    {
        if (r.success)
            std::cout << "[" << surface << "] " << r.key.member() << " " << r.image->width() << "x"
                      << r.image->height() << " " << r.image->colorMode() << '\n';
        else
            std::cout << "[" << surface << "] " << r.key.member() << ": " << describeError(r.error) << '\n';
    }

    void show(const std::optional<Position> &pos, bool forceReload)
    {
        if (!pos)
        {
            std::cout << "> No image\n";
            return;
        }

        const auto &config = m_engine.config();
        LoadRequest request = m_engine.viewerRequest(pos->archive, pos->member);
        request.forceReload = forceReload;
        m_viewerCursor.expect(request.key());

        std::cout << "> [" << pos->archiveIndex + 1 << "/" << m_navigator.archives().size() << "] "
                  << fs::path(pos->archive).filename().string() << " : " << pos->member << '\n';
        m_engine.coordinator().submit(std::move(request));

        const auto &members = m_navigator.archives()[pos->archiveIndex].members;
        m_engine.preloader().schedule(pos->archive, members, pos->imageIndex, m_navigator.lastDirection(),
                                      ImageVariant::original(), config.effectiveMaxViewerLoad(), config.performanceMode);

        // 最后一张时顺便预取下一个压缩包的封面
        const std::size_t nextArchive = pos->archiveIndex + 1;
        if (pos->imageIndex + 1 == members.size() && nextArchive < m_navigator.archives().size())
        {
            const auto &next = m_navigator.archives()[nextArchive];
            if (!next.members.empty())
                m_engine.preloader().scheduleNextCover(next.path, next.members.front(), config.effectiveThumbnailSize(),
                                                       config.effectiveMaxThumbnailLoad(), config.performanceMode);
        }
    }

    void requestCover()
    {
        auto pos = m_navigator.current();
        if (!pos)
            return;
        const auto &members = m_navigator.archives()[pos->archiveIndex].members;
        LoadRequest request = m_engine.thumbnailRequest(pos->archive, members.front());
        m_galleryCursor.expect(request.key());
        m_engine.coordinator().submit(std::move(request));
    }

    void printStats()
    {
        CacheStats s = m_engine.cache().stats();
        std::cout << "> Cache [" << strategyName(s.strategy) << "] " << s.size << "/" << s.capacity
                  << " hits " << s.hits << " misses " << s.misses
                  << " hit rate " << static_cast<int>(s.hitRate * 100) << "%"
                  << " evictions " << s.evictions
                  << " memory " << s.memoryEstimate / (1024 * 1024) << " MiB"
                  << " | archives open " << m_engine.archives().size() << "/" << m_engine.archives().bound()
                  << '\n';
    }

    ImageEngine &m_engine;
    ArchiveNavigator m_navigator;
    ConsumerCursor m_viewerCursor;
    ConsumerCursor m_galleryCursor;
    ResultRouter::SurfaceId m_viewerId = 0;
    ResultRouter::SurfaceId m_galleryId = 0;
};

void runTerminalMode(QCoreApplication &app, const AppConfig &config)
{
    ImageEngine engine(config);
    TerminalSession session(engine);
    ResultPump pump(engine.channel(), engine.router(), config.pumpIntervalMs);

    if (config.rootDir.empty())
    {
        std::cerr << "Warning: No root directory provided. Use --root-dir=/path/to/archives\n";
    }
    else
    {
        std::cout << "Scanning " << config.rootDir << " ...\n";
        auto start = std::chrono::high_resolution_clock::now();

        engine.scanner().setProgressCallback([](std::size_t done, std::size_t total)
                                             { std::cout << "  " << done << "/" << total << " archives analyzed\n"; });
        engine.scanner().startScan(config.rootDir);
        while (!engine.scanner().isScanCompleted())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        auto results = engine.scanner().results();
        std::cout << "Scan completed in " << duration.count() << " ms, " << results.size() << " valid archives\n";
        session.setArchives(std::move(results));
    }

    std::cout << "==========================================\n";
    std::cout << "          Arkview - Terminal Mode         \n";
    std::cout << "==========================================\n";
    std::cout << " [,] Prev image     [.] Next image\n";
    std::cout << " [[] Prev archive   []] Next archive\n";
    std::cout << " [t] Cover thumb    [f] Force reload\n";
    std::cout << " [m] Perf mode      [s] Cache stats\n";
    std::cout << " [c] Clear caches   [q] Quit\n";
    std::cout << "==========================================\n";

    pump.start();
    session.start();

    RawTerminal terminal;

    // 键盘线程只负责读键，处理投递回 Qt 主线程
    std::thread inputThread([&]()
                            {
        for (;;) {
            const int c = terminal.readKey(std::chrono::milliseconds(50));
            if (c == RawTerminal::kNoKey)
                continue;
            if (c == 'q' || c == 3 || c == RawTerminal::kEndOfInput) {
                std::cout << "> Quitting...\n";
                QMetaObject::invokeMethod(&app, [&app]() { app.quit(); }, Qt::QueuedConnection);
                break;
            }
            QMetaObject::invokeMethod(&app, [&session, c]() { session.onKey(c); }, Qt::QueuedConnection);
        } });

    app.exec();

    if (inputThread.joinable())
    {
        inputThread.join();
    }

    pump.stop();
    spdlog::info("Shutting down ImageEngine...");
    engine.shutdown();
}

// =========================================================
//  Logger Initialization
// =========================================================
void initLogger(bool verbose)
{
    try
    {
        spdlog::level::level_enum default_level = spdlog::level::err;
#ifdef DEBUG
        default_level = spdlog::level::debug;
#endif
        if (verbose)
            default_level = spdlog::level::debug;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");

        const std::string log_file_name = "arkview.log";
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file_name, 1024 * 1024 * 10, 3);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>(LOG_NAME.data(), sinks.begin(), sinks.end());

        logger->set_level(default_level);
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::milliseconds(100));
    }
    catch (const spdlog::spdlog_ex &ex)
    {
        std::cerr << "Global Logger initialization failed: " << ex.what() << "\n";
    }
}

// =========================================================
//  Main Entry Point
// =========================================================
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("Arkview");
    app.setApplicationName("Arkview");

    AppConfig config;
    QString message;
    switch (AppConfig::fromArguments(app.arguments(), config, message))
    {
    case AppConfig::ParseResult::HelpRequested:
        std::cout << message.toStdString();
        return 0;
    case AppConfig::ParseResult::Error:
        std::cerr << message.toStdString() << '\n';
        return 1;
    case AppConfig::ParseResult::Ok:
        break;
    }

    initLogger(config.verbose);

    try
    {
        runTerminalMode(app, config);
    }
    catch (const ArkviewError &e)
    {
        spdlog::error("Fatal: {} ({})", e.what(), errorKindName(e.kind()));
        std::cerr << "Fatal: " << e.what() << '\n';
        spdlog::shutdown();
        return 1;
    }

    // 清理 spdlog
    spdlog::drop_all();
    spdlog::shutdown();
    return 0;
}
