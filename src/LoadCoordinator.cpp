#include "LoadCoordinator.hpp"

#include <opencv2/core.hpp>

// ==========================================
// LoadTicket
// ==========================================

LoadTicket::LoadTicket(CacheKey key, std::shared_future<LoadResult> future, std::shared_ptr<LoadJob> job) :
    m_key(std::move(key)), m_future(std::move(future)), m_job(std::move(job)),
    m_withdrawn(std::make_shared<std::atomic<bool>>(false))
{
}

bool LoadTicket::ready() const
{
    return m_future.valid() && m_future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool LoadTicket::waitFor(std::chrono::milliseconds timeout) const
{
    return m_future.valid() && m_future.wait_for(timeout) == std::future_status::ready;
}

LoadResult LoadTicket::get() const
{
    if (!m_future.valid())
        return LoadResult::failure(m_key, LoadErrorKind::Internal, "Empty ticket");
    return m_future.get();
}

void LoadTicket::cancel()
{
    if (!m_job || !m_withdrawn)
        return;
    if (!m_withdrawn->exchange(true))
        m_job->waiters.fetch_sub(1);
}

bool LoadTicket::cancelled() const
{
    return m_withdrawn && m_withdrawn->load();
}

// ==========================================
// LoadCoordinator
// ==========================================

LoadCoordinator::LoadCoordinator(ImageCache &cache, ArchivePool &archives, ImageDecoder &decoder,
                                 WorkerPool &workers, ResultChannel &channel) :
    m_cache(cache), m_archives(archives), m_decoder(decoder), m_workers(workers), m_channel(channel)
{
}

LoadCoordinator::~LoadCoordinator()
{
    // 任务持有 this，必须先等它们结束
    m_workers.waitIdle();
}

LoadTicket LoadCoordinator::submit(LoadRequest request)
{
    if (request.maxByteSize == 0)
        throw ArkviewError(LoadErrorKind::InvalidCapacity, "maxByteSize must be positive.");

    const CacheKey key = request.key();

    // 1. 已在跑：直接挂上去
    std::shared_ptr<LoadJob> coalesced;
    bool promote = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_inFlight.find(key);
        if (it != m_inFlight.end())
        {
            coalesced = it->second;
            promote = attachLocked(*coalesced, request);
        }
    }
    if (coalesced)
    {
        if (promote)
            dispatch(coalesced, TaskPriority::High);
        return LoadTicket(key, coalesced->future, coalesced);
    }

    // 2. 缓存检查
    ImageRef original;
    if (!request.forceReload)
    {
        if (request.variant.isOriginal() || request.cacheVariant)
        {
            if (ImageRef hit = m_cache.get(key))
                return deliverNow(key, std::move(hit));
        }
        if (!request.variant.isOriginal())
            original = m_cache.get(key.originalKey());
    }

    // 3. 新建任务（加锁重查，防止并发的两个 miss 各派一次）
    std::shared_ptr<LoadJob> job;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_inFlight.find(key);
        if (it != m_inFlight.end())
        {
            coalesced = it->second;
            promote = attachLocked(*coalesced, request);
        }
        else
        {
            job = std::make_shared<LoadJob>();
            job->request = std::move(request);
            job->key = key;
            job->original = std::move(original);
            job->future = job->promise.get_future().share();
            m_inFlight.emplace(key, job);
        }
    }
    if (coalesced)
    {
        if (promote)
            dispatch(coalesced, TaskPriority::High);
        return LoadTicket(key, coalesced->future, coalesced);
    }

    dispatch(job, job->request.priority == LoadPriority::Normal ? TaskPriority::High : TaskPriority::Low);
    return LoadTicket(key, job->future, job);
}

bool LoadCoordinator::attachLocked(LoadJob &job, const LoadRequest &request)
{
    job.waiters.fetch_add(1);
    spdlog::debug("[LoadCoordinator] Coalesced request for {}", job.key.toString());

    // 用户请求挂到还在排队的预加载任务上：补派一个高优先级 runner，谁先认领谁执行
    if (request.priority != LoadPriority::Normal || job.request.priority != LoadPriority::Preload)
        return false;
    if (job.started || job.promoted)
        return false;
    job.promoted = true;
    spdlog::debug("[LoadCoordinator] Promoted queued preload {}", job.key.toString());
    return true;
}

LoadTicket LoadCoordinator::deliverNow(const CacheKey &key, ImageRef image)
{
    LoadResult result = LoadResult::ok(key, std::move(image));
    std::promise<LoadResult> promise;
    promise.set_value(result);
    m_channel.post(std::move(result));
    return LoadTicket(key, promise.get_future().share(), nullptr);
}

void LoadCoordinator::dispatch(const std::shared_ptr<LoadJob> &job, TaskPriority priority)
{
    m_workers.detach(priority, [this, job]()
                     { runJob(job); });
}

void LoadCoordinator::runJob(const std::shared_ptr<LoadJob> &job)
{
    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (job->started)
            return;
        job->started = true;
        cancelled = job->waiters.load() <= 0;
    }

    if (cancelled)
    {
        spdlog::debug("[LoadCoordinator] Cancelled before start: {}", job->key.toString());
        finish(job, LoadResult::failure(job->key, LoadErrorKind::Cancelled, "Cancelled"), false);
        return;
    }

    ImageRef original = std::move(job->original);
    finish(job, execute(job->request, job->key, std::move(original)), true);
}

void LoadCoordinator::finish(const std::shared_ptr<LoadJob> &job, LoadResult result, bool post)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_inFlight.find(job->key);
        if (it != m_inFlight.end() && it->second == job)
            m_inFlight.erase(it);
    }
    job->promise.set_value(result);
    if (post)
        m_channel.post(std::move(result));
}

LoadResult LoadCoordinator::execute(const LoadRequest &request, const CacheKey &key, ImageRef original)
{
    try
    {
        ImageRef full = std::move(original);
        if (!full)
        {
            auto handle = m_archives.acquire(request.archive);

            auto member = handle->findMember(request.member);
            if (!member || member->isDir)
                throw ArkviewError(LoadErrorKind::MemberNotFound, "Member '" + request.member + "' not found");
            if (member->size > request.maxByteSize)
                throw ArkviewError(LoadErrorKind::MemberTooLarge,
                                   fmt::format("Too large ({} > {})", member->size, request.maxByteSize));

            std::vector<std::uint8_t> bytes = handle->readMember(request.member, request.maxByteSize);
            full = m_decoder.decode(bytes, request.maxByteSize, ImageVariant::original(), request.performanceMode);
            m_cache.put(key.originalKey(), full);
        }

        ImageRef out = m_decoder.resample(full, request.variant, request.performanceMode);
        if (request.cacheVariant && !request.variant.isOriginal())
            m_cache.put(key, out);

        spdlog::debug("[LoadCoordinator] Loaded {} ({}x{})", key.toString(), out->width(), out->height());
        return LoadResult::ok(key, std::move(out));
    }
    catch (const ArkviewError &e)
    {
        spdlog::error("[LoadCoordinator] {} failed ({}): {}", key.toString(), errorKindName(e.kind()), e.what());
        return LoadResult::failure(key, e.kind(), e.what());
    }
    catch (const std::bad_alloc &)
    {
        spdlog::error("[LoadCoordinator] {} failed: out of memory", key.toString());
        return LoadResult::failure(key, LoadErrorKind::OutOfMemory, describeError(LoadErrorKind::OutOfMemory));
    }
    catch (const cv::Exception &e)
    {
        spdlog::error("[LoadCoordinator] {} failed (OpenCV): {}", key.toString(), e.what());
        return LoadResult::failure(key, LoadErrorKind::UnsupportedFormat, e.what());
    }
    catch (const std::exception &e)
    {
        spdlog::error("[LoadCoordinator] {} failed: {}", key.toString(), e.what());
        return LoadResult::failure(key, LoadErrorKind::Internal, e.what());
    }
    catch (...)
    {
        spdlog::error("[LoadCoordinator] {} failed: unknown exception", key.toString());
        return LoadResult::failure(key, LoadErrorKind::Internal, "Unknown exception");
    }
}

bool LoadCoordinator::isInFlight(const CacheKey &key) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight.contains(key);
}

std::size_t LoadCoordinator::inFlightCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inFlight.size();
}

void LoadCoordinator::waitIdle()
{
    m_workers.waitIdle();
}
