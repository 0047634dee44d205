#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

import Core;

using namespace Core::Tasks;

namespace
{
    struct OrderLog
    {
        std::mutex Mutex;
        std::vector<int> Order;

        void Push(int value)
        {
            std::lock_guard lock(Mutex);
            Order.push_back(value);
        }
    };

    JobInfo MakeJob(JobPriority priority, OrderLog* log, int tag)
    {
        JobInfo job;
        job.Priority = priority;
        job.Entry = [log, tag]
        {
            log->Push(tag);
            return true;
        };
        return job;
    }
}

TEST(CoreTasks, RunsEveryJob)
{
    JobSystem jobs(JobSystemConfig{.ThreadCount = 4});

    std::atomic<int> counter = 0;
    for (int i = 0; i < 100; ++i)
    {
        JobInfo job;
        job.Entry = [&counter]
        {
            counter++;
            return true;
        };
        ASSERT_TRUE(jobs.Submit(std::move(job)).has_value());
    }

    jobs.WaitForIdle();
    EXPECT_EQ(counter, 100);
}

TEST(CoreTasks, HigherPriorityRunsFirst)
{
    // One General worker, held busy while the queue fills up.
    JobSystem jobs(JobSystemConfig{.TypeMasks = {ToMask(JobType::General)}});

    std::atomic<bool> release = false;
    std::atomic<bool> started = false;
    JobInfo blocker;
    blocker.Entry = [&release, &started]
    {
        started = true;
        while (!release) std::this_thread::yield();
        return true;
    };
    ASSERT_TRUE(jobs.Submit(std::move(blocker)).has_value());
    while (!started) std::this_thread::yield();

    OrderLog log;
    ASSERT_TRUE(jobs.Submit(MakeJob(JobPriority::Low, &log, 3)).has_value());
    ASSERT_TRUE(jobs.Submit(MakeJob(JobPriority::Normal, &log, 2)).has_value());
    ASSERT_TRUE(jobs.Submit(MakeJob(JobPriority::High, &log, 1)).has_value());
    ASSERT_TRUE(jobs.Submit(MakeJob(JobPriority::High, &log, 11)).has_value());

    release = true;
    jobs.WaitForIdle();

    EXPECT_EQ(log.Order, (std::vector<int>{1, 11, 2, 3}));
}

TEST(CoreTasks, CallbacksRunOnUpdateThread)
{
    JobSystem jobs(JobSystemConfig{.ThreadCount = 2});

    const auto mainThread = std::this_thread::get_id();
    std::thread::id successThread;
    int successes = 0;
    int failures = 0;

    JobInfo good;
    good.Entry = [] { return true; };
    good.OnSuccess = [&] { ++successes; successThread = std::this_thread::get_id(); };
    good.OnFailure = [&] { ++failures; };

    JobInfo bad;
    bad.Entry = [] { return false; };
    bad.OnSuccess = [&] { ++successes; };
    bad.OnFailure = [&] { ++failures; };

    ASSERT_TRUE(jobs.Submit(std::move(good)).has_value());
    ASSERT_TRUE(jobs.Submit(std::move(bad)).has_value());
    jobs.WaitForIdle();

    // Nothing fires until the owner drains the results.
    EXPECT_EQ(successes, 0);
    EXPECT_EQ(failures, 0);
    EXPECT_EQ(jobs.GetPendingResultCount(), 2u);

    jobs.Update();
    EXPECT_EQ(successes, 1);
    EXPECT_EQ(failures, 1);
    EXPECT_EQ(successThread, mainThread);
    EXPECT_EQ(jobs.GetPendingResultCount(), 0u);
}

TEST(CoreTasks, DefaultMasksSplitLoadsFromGeneralWork)
{
    JobSystem single(JobSystemConfig{.ThreadCount = 1});
    ASSERT_EQ(single.GetThreadCount(), 1u);
    EXPECT_EQ(single.GetThreadMask(0),
              ToMask(JobType::General) | ToMask(JobType::ResourceLoad) | ToMask(JobType::GpuResource));

    JobSystem pinned(JobSystemConfig{.ThreadCount = 3, .BackendIsMultithreaded = false});
    EXPECT_EQ(pinned.GetThreadMask(0), ToMask(JobType::ResourceLoad) | ToMask(JobType::GpuResource));
    EXPECT_EQ(pinned.GetThreadMask(1), ToMask(JobType::General));
    EXPECT_EQ(pinned.GetThreadMask(2), ToMask(JobType::General));

    JobSystem threaded(JobSystemConfig{.ThreadCount = 3, .BackendIsMultithreaded = true});
    EXPECT_EQ(threaded.GetThreadMask(0), ToMask(JobType::ResourceLoad));
    EXPECT_EQ(threaded.GetThreadMask(1), ToMask(JobType::General) | ToMask(JobType::GpuResource));
    EXPECT_EQ(threaded.GetThreadMask(5), 0u);
}

TEST(CoreTasks, RejectsUnservedTypeAndSubmitAfterShutdown)
{
    JobSystem jobs(JobSystemConfig{.TypeMasks = {ToMask(JobType::General)}});

    JobInfo load;
    load.Type = JobType::ResourceLoad;
    load.Entry = [] { return true; };
    auto rejected = jobs.Submit(std::move(load));
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), Core::ErrorCode::InvalidArgument);

    jobs.Shutdown();

    JobInfo late;
    late.Entry = [] { return true; };
    auto afterShutdown = jobs.Submit(std::move(late));
    ASSERT_FALSE(afterShutdown.has_value());
    EXPECT_EQ(afterShutdown.error(), Core::ErrorCode::InvalidState);
}

TEST(CoreTasks, LocalTaskMovesPayload)
{
    int value = 0;
    LocalTask task = [&value]
    {
        value = 7;
        return true;
    };
    LocalTask moved = std::move(task);

    EXPECT_FALSE(task.Valid());
    ASSERT_TRUE(moved.Valid());
    EXPECT_TRUE(moved());
    EXPECT_EQ(value, 7);

    LocalTask empty;
    EXPECT_FALSE(empty());
}
