module;
#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

module Core;

namespace Core::Tasks
{
    LocalTask::~LocalTask()
    {
        if (m_VTable) std::destroy_at(m_VTable);
    }

    LocalTask::LocalTask(LocalTask&& other) noexcept
    {
        if (other.m_VTable)
        {
            other.m_VTable->MoveTo(m_Storage);
            m_VTable = reinterpret_cast<Concept*>(m_Storage);
            std::destroy_at(other.m_VTable);
            other.m_VTable = nullptr;
        }
    }

    LocalTask& LocalTask::operator=(LocalTask&& other) noexcept
    {
        if (this != &other)
        {
            if (m_VTable) std::destroy_at(m_VTable);
            m_VTable = nullptr;

            if (other.m_VTable)
            {
                other.m_VTable->MoveTo(m_Storage);
                m_VTable = reinterpret_cast<Concept*>(m_Storage);
                std::destroy_at(other.m_VTable);
                other.m_VTable = nullptr;
            }
        }
        return *this;
    }

    bool LocalTask::operator()()
    {
        return m_VTable ? m_VTable->Execute() : false;
    }

    namespace
    {
        struct JobResult
        {
            bool Succeeded = false;
            std::function<void()> OnSuccess;
            std::function<void()> OnFailure;
        };

        constexpr size_t PriorityIndex(JobPriority priority)
        {
            // Scan order: High, Normal, Low.
            switch (priority)
            {
            case JobPriority::High:   return 0;
            case JobPriority::Normal: return 1;
            case JobPriority::Low:    return 2;
            }
            return 1;
        }
    }

    struct JobSystem::Context
    {
        std::vector<std::thread> Workers;
        std::vector<uint8_t> Masks;

        std::array<std::deque<JobInfo>, 3> Queues;
        std::mutex QueueMutex;
        std::condition_variable WakeCondition;

        std::mutex ResultMutex;
        RingQueue<JobResult> Results{MAX_JOB_RESULTS};

        std::mutex IdleMutex;
        std::condition_variable IdleCondition;
        size_t Outstanding = 0;

        std::atomic<bool> IsRunning{false};
    };

    JobSystem::JobSystem(const JobSystemConfig& config)
        : m_Ctx(std::make_unique<Context>())
    {
        if (!config.TypeMasks.empty())
        {
            m_Ctx->Masks = config.TypeMasks;
        }
        else
        {
            uint32_t threadCount = config.ThreadCount;
            if (threadCount == 0)
            {
                threadCount = std::thread::hardware_concurrency();
                if (threadCount > 1) threadCount--; // Leave a core for the main thread
                threadCount = std::clamp(threadCount, 1u, 15u);
            }

            const uint8_t all = ToMask(JobType::General) | ToMask(JobType::ResourceLoad) | ToMask(JobType::GpuResource);
            if (threadCount == 1)
            {
                m_Ctx->Masks.push_back(all);
            }
            else
            {
                // Worker 0 owns disk I/O so loads never contend with each other.
                uint8_t first = ToMask(JobType::ResourceLoad);
                if (!config.BackendIsMultithreaded) first |= ToMask(JobType::GpuResource);
                m_Ctx->Masks.push_back(first);

                for (uint32_t i = 1; i < threadCount; ++i)
                {
                    uint8_t mask = ToMask(JobType::General);
                    if (config.BackendIsMultithreaded && i == 1) mask |= ToMask(JobType::GpuResource);
                    m_Ctx->Masks.push_back(mask);
                }
            }
        }

        m_Ctx->IsRunning = true;
        Log::Info("Initializing JobSystem with {} worker threads.", m_Ctx->Masks.size());

        for (uint32_t i = 0; i < m_Ctx->Masks.size(); ++i)
        {
            m_Ctx->Workers.emplace_back([this, i] { WorkerEntry(i); });
        }
    }

    JobSystem::~JobSystem()
    {
        Shutdown();
    }

    void JobSystem::Shutdown()
    {
        if (!m_Ctx->IsRunning) return;

        {
            std::lock_guard lock(m_Ctx->QueueMutex);
            m_Ctx->IsRunning = false;
        }
        m_Ctx->WakeCondition.notify_all();

        for (auto& t : m_Ctx->Workers)
        {
            if (t.joinable()) t.join();
        }
        m_Ctx->Workers.clear();

        size_t dropped = 0;
        {
            std::lock_guard lock(m_Ctx->QueueMutex);
            for (auto& queue : m_Ctx->Queues)
            {
                dropped += queue.size();
                queue.clear();
            }
        }
        if (dropped > 0)
            Log::Warn("JobSystem shut down with {} queued jobs that never started.", dropped);

        {
            std::lock_guard lock(m_Ctx->IdleMutex);
            m_Ctx->Outstanding = 0;
        }
        m_Ctx->IdleCondition.notify_all();
    }

    Result JobSystem::Submit(JobInfo job)
    {
        if (!m_Ctx->IsRunning)
        {
            Log::Error("JobSystem::Submit called after shutdown.");
            return Err(ErrorCode::InvalidState);
        }

        const uint8_t type = ToMask(job.Type);
        const bool accepted = std::ranges::any_of(m_Ctx->Masks, [type](uint8_t mask) { return (mask & type) != 0; });
        if (!accepted)
        {
            Log::Error("JobSystem::Submit: no worker accepts job type 0x{:02x}.", type);
            return Err(ErrorCode::InvalidArgument);
        }

        {
            std::lock_guard lock(m_Ctx->IdleMutex);
            ++m_Ctx->Outstanding;
        }
        {
            std::lock_guard lock(m_Ctx->QueueMutex);
            m_Ctx->Queues[PriorityIndex(job.Priority)].push_back(std::move(job));
        }
        // Masks differ per worker, so a single notify could wake one that cannot take the job.
        m_Ctx->WakeCondition.notify_all();
        return Ok();
    }

    void JobSystem::Update()
    {
        // Drain under the lock, run callbacks outside it so they may submit new jobs.
        std::vector<JobResult> ready;
        {
            std::lock_guard lock(m_Ctx->ResultMutex);
            while (auto result = m_Ctx->Results.Dequeue())
            {
                ready.push_back(std::move(*result));
            }
        }

        for (auto& result : ready)
        {
            if (result.Succeeded)
            {
                if (result.OnSuccess) result.OnSuccess();
            }
            else if (result.OnFailure)
            {
                result.OnFailure();
            }
        }
    }

    void JobSystem::WaitForIdle()
    {
        std::unique_lock lock(m_Ctx->IdleMutex);
        m_Ctx->IdleCondition.wait(lock, [this] { return m_Ctx->Outstanding == 0; });
    }

    uint32_t JobSystem::GetThreadCount() const
    {
        return static_cast<uint32_t>(m_Ctx->Masks.size());
    }

    uint8_t JobSystem::GetThreadMask(uint32_t threadIndex) const
    {
        return threadIndex < m_Ctx->Masks.size() ? m_Ctx->Masks[threadIndex] : 0;
    }

    size_t JobSystem::GetPendingResultCount() const
    {
        std::lock_guard lock(m_Ctx->ResultMutex);
        return m_Ctx->Results.Size();
    }

    void JobSystem::WorkerEntry(uint32_t threadIndex)
    {
        const uint8_t mask = m_Ctx->Masks[threadIndex];

        auto takeJob = [this, mask](JobInfo& out) -> bool
        {
            // Strict priority: a lower queue is only consulted when every higher one
            // holds nothing this worker may run.
            for (auto& queue : m_Ctx->Queues)
            {
                auto it = std::ranges::find_if(queue, [mask](const JobInfo& job)
                {
                    return (ToMask(job.Type) & mask) != 0;
                });
                if (it != queue.end())
                {
                    out = std::move(*it);
                    queue.erase(it);
                    return true;
                }
            }
            return false;
        };

        while (true)
        {
            JobInfo job;
            {
                std::unique_lock lock(m_Ctx->QueueMutex);
                bool found = false;
                m_Ctx->WakeCondition.wait(lock, [&]
                {
                    if (!m_Ctx->IsRunning) return true;
                    found = takeJob(job);
                    return found;
                });

                if (!found) return;
            }

            const bool succeeded = job.Entry();

            if (job.OnSuccess || job.OnFailure)
            {
                JobResult result{succeeded, std::move(job.OnSuccess), std::move(job.OnFailure)};
                std::lock_guard lock(m_Ctx->ResultMutex);
                if (!m_Ctx->Results.Enqueue(std::move(result)))
                {
                    Log::Error("JobSystem: result queue is full ({} entries); completion callback dropped.",
                               MAX_JOB_RESULTS);
                }
            }
            else if (!succeeded)
            {
                Log::Warn("JobSystem: job without callbacks reported failure.");
            }

            {
                std::lock_guard lock(m_Ctx->IdleMutex);
                if (m_Ctx->Outstanding > 0) --m_Ctx->Outstanding;
            }
            m_Ctx->IdleCondition.notify_all();
        }
    }
}
