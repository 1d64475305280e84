#include "ArchiveScanner.hpp"
#include "ArchiveHandle.hpp"
#include "LoadError.hpp"

namespace
{

const std::array<std::string_view, 8> kImageExts = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp", ".ico"};

bool hasExtension(std::string_view filename, std::string_view ext)
{
    if (filename.length() < ext.length())
        return false;
    auto suffix = filename.substr(filename.length() - ext.length());
    return std::ranges::equal(suffix, ext, [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)); });
}

} // namespace

ArchiveScanner::ArchiveScanner(WorkerPool &workers, std::size_t batchSize, std::size_t progressInterval) :
    m_workers(workers), m_batchSize(batchSize == 0 ? 1 : batchSize),
    m_progressInterval(progressInterval == 0 ? 1 : progressInterval)
{
}

bool ArchiveScanner::isImageFile(std::string_view name)
{
    return std::ranges::any_of(kImageExts, [name](std::string_view ext)
                               { return hasExtension(name, ext); });
}

ArchiveInfo ArchiveScanner::analyzeArchive(const fs::path &path, bool collectMembers)
{
    ArchiveInfo info;
    info.path = path.string();

    std::error_code ec;
    if (!fs::exists(path, ec))
        return info;
    info.fileSize = fs::file_size(path, ec);
    info.modTime = fs::last_write_time(path, ec);

    if (info.fileSize > kMaxArchiveBytes)
    {
        spdlog::warn("[ArchiveScanner] Skipping {} ({} bytes, too large)", info.path, info.fileSize);
        return info;
    }

    std::shared_ptr<ArchiveHandle> handle;
    try
    {
        handle = ArchiveHandle::open(path);
    }
    catch (const ArkviewError &e)
    {
        spdlog::warn("[ArchiveScanner] {}: {}", errorKindName(e.kind()), e.what());
        return info;
    }

    const auto &entries = handle->members();
    if (entries.empty() || entries.size() > kMaxEntries)
        return info;

    bool onlyImages = true;
    bool hasFile = false;
    const std::size_t limit = std::min(entries.size(), kCheckedEntries);
    for (std::size_t i = 0; i < limit; ++i)
    {
        const auto &entry = entries[i];
        if (entry.isDir)
            continue;

        hasFile = true;
        if (isImageFile(entry.name))
        {
            ++info.imageCount;
            if (collectMembers)
                info.members.push_back(entry.name);
        }
        else
        {
            onlyImages = false;
            info.members.clear();
            break;
        }
    }

    // 超过检查上限的部分没有看过，不能认定为纯图片
    if (limit == kCheckedEntries && entries.size() > kCheckedEntries)
    {
        info.members.clear();
        return info;
    }

    info.valid = hasFile && onlyImages;
    if (!info.valid)
        info.members.clear();
    return info;
}

std::vector<fs::path> ArchiveScanner::findArchives(const fs::path &root, std::stop_token stoken)
{
    std::vector<fs::path> found;
    std::error_code ec;
    if (!fs::exists(root, ec))
        return found;

    if (fs::is_regular_file(root, ec))
    {
        if (hasExtension(root.string(), ".zip"))
            found.push_back(root);
        return found;
    }

    auto options = fs::directory_options::skip_permission_denied;
    for (auto it = fs::recursive_directory_iterator(root, options, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
    {
        if (stoken.stop_requested())
            return {};
        if (it->is_symlink(ec))
        {
            if (it->is_directory(ec))
                it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file(ec) && hasExtension(it->path().string(), ".zip"))
            found.push_back(it->path());
    }
    if (ec)
        spdlog::error("[ArchiveScanner] Scan error under {}: {}", root.string(), ec.message());

    std::ranges::sort(found);
    return found;
}

std::vector<ArchiveInfo> ArchiveScanner::runScan(const fs::path &root, std::stop_token stoken)
{
    const auto paths = findArchives(root, stoken);
    const std::size_t total = paths.size();
    spdlog::info("[ArchiveScanner] Found {} archives under {}", total, root.string());

    std::vector<ArchiveInfo> valid;
    std::size_t done = 0;

    // 批量提交任务
    for (std::size_t i = 0; i < total; i += m_batchSize)
    {
        if (stoken.stop_requested())
            return valid;

        const std::size_t end = std::min(i + m_batchSize, total);
        std::vector<std::future<ArchiveInfo>> futures;
        futures.reserve(end - i);
        for (std::size_t j = i; j < end; ++j)
            futures.push_back(m_workers.enqueue(TaskPriority::Low, &ArchiveScanner::analyzeArchive, paths[j], true));

        for (auto &f : futures)
        {
            ArchiveInfo info = f.get();
            if (info.valid)
                valid.push_back(std::move(info));

            ++done;
            if (m_onProgress && (done % m_progressInterval == 0 || done == total))
                m_onProgress(done, total);
        }
    }
    return valid;
}

std::vector<ArchiveInfo> ArchiveScanner::scanDirectory(const fs::path &root)
{
    return runScan(root, {});
}

void ArchiveScanner::startScan(const fs::path &root)
{
    stopScan();
    m_scanCompleted = false;
    {
        std::lock_guard<std::mutex> lock(m_resultMutex);
        m_results.clear();
    }

    m_scanThread = std::jthread([this, root](std::stop_token stoken)
                                {
        auto found = runScan(root, stoken);
        if (stoken.stop_requested())
            return;
        {
            std::lock_guard<std::mutex> lock(m_resultMutex);
            m_results = found;
        }
        m_scanCompleted = true;
        spdlog::info("[ArchiveScanner] Scan finished: {} valid archives", found.size());
        if (m_onFinished)
            m_onFinished(found); });
}

void ArchiveScanner::stopScan()
{
    if (m_scanThread.joinable())
    {
        m_scanThread.request_stop();
        m_scanThread.join();
    }
}

bool ArchiveScanner::isScanCompleted() const
{
    return m_scanCompleted.load();
}

std::vector<ArchiveInfo> ArchiveScanner::results() const
{
    std::lock_guard<std::mutex> lock(m_resultMutex);
    return m_results;
}

void ArchiveScanner::setProgressCallback(ProgressCallback cb)
{
    m_onProgress = std::move(cb);
}

void ArchiveScanner::setScanFinishedCallback(FinishedCallback cb)
{
    m_onFinished = std::move(cb);
}
