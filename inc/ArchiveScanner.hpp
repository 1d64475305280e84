#ifndef _ARCHIVE_SCANNER_HPP_
#define _ARCHIVE_SCANNER_HPP_

#include "PCH.h"
#include "WorkerPool.hpp"

struct ArchiveInfo
{
    std::string path;
    bool valid = false;
    std::vector<std::string> members; // 仅 valid 且要求收集时非空，按压缩包内顺序
    fs::file_time_type modTime{};
    std::uint64_t fileSize = 0;
    std::size_t imageCount = 0;
};

/**
 * @class ArchiveScanner
 * @brief 扫描目录下的 ZIP，筛出"只包含图片"的压缩包
 *
 * 使用 C++20 std::jthread 管理后台扫描线程，分析工作按批提交到 WorkerPool。
 */
class ArchiveScanner
{
public:
    static constexpr std::uint64_t kMaxArchiveBytes = 500ull * 1024 * 1024;
    static constexpr std::size_t kMaxEntries = 10000;
    static constexpr std::size_t kCheckedEntries = 1000;
    static constexpr std::size_t kDefaultBatchSize = 50;
    static constexpr std::size_t kDefaultProgressInterval = 20;

    using ProgressCallback = std::function<void(std::size_t done, std::size_t total)>;
    using FinishedCallback = std::function<void(const std::vector<ArchiveInfo> &)>;

    explicit ArchiveScanner(WorkerPool &workers,
                            std::size_t batchSize = kDefaultBatchSize,
                            std::size_t progressInterval = kDefaultProgressInterval);

    /**
     * @brief 析构函数
     * jthread 会自动请求停止并等待线程结束。
     */
    ~ArchiveScanner() = default;

    ArchiveScanner(const ArchiveScanner &) = delete;
    ArchiveScanner &operator=(const ArchiveScanner &) = delete;

    // 忽略大小写的后缀匹配
    static bool isImageFile(std::string_view name);

    /**
     * @brief 分析单个压缩包
     * 遇到第一个非图片条目即判为无效并丢弃成员列表。打开失败同样返回无效，不抛出。
     */
    static ArchiveInfo analyzeArchive(const fs::path &path, bool collectMembers = true);

    // 递归找出 root 下所有 *.zip，按路径排序
    static std::vector<fs::path> findArchives(const fs::path &root, std::stop_token stoken = {});

    /**
     * @brief 启动异步扫描
     * 如果已有任务在运行，会先中断并等待其结束。
     */
    void startScan(const fs::path &root);
    void stopScan();
    bool isScanCompleted() const;

    // 扫描完成后的结果（仅有效压缩包）
    std::vector<ArchiveInfo> results() const;

    // 同步版本
    std::vector<ArchiveInfo> scanDirectory(const fs::path &root);

    void setProgressCallback(ProgressCallback cb);
    void setScanFinishedCallback(FinishedCallback cb);

private:
    std::vector<ArchiveInfo> runScan(const fs::path &root, std::stop_token stoken);

    WorkerPool &m_workers;
    std::size_t m_batchSize;
    std::size_t m_progressInterval;

    ProgressCallback m_onProgress;
    FinishedCallback m_onFinished;

    mutable std::mutex m_resultMutex;
    std::vector<ArchiveInfo> m_results;
    std::atomic<bool> m_scanCompleted{false};

    // 放在最后：析构时最先 join
    std::jthread m_scanThread;
};

#endif
