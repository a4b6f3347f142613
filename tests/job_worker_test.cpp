// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#include <algorithm>
#include <atomic>
#include <future>
#include <thread>
#include <gtest/gtest.h>
#include "test_utils.h"
#include "../JobSync/Source/afs/native.h"
#include "../JobSync/Source/base/job_base.h"
#include "../JobSync/Source/base/job_worker.h"

using namespace zen;
using namespace jsync;
using namespace jsync::test;


namespace
{
//reports "fileCount" files of "fileSize" bytes without touching the disk
class FakeJob : public JobBase
{
public:
    FakeJob(const std::wstring& name, size_t fileCount, uint64_t fileSize = 100) : JobBase(name), fileCount_(fileCount), fileSize_(fileSize) {}

    FileCounterResult countFiles() const override //throw FileError
    {
        if (failCounting)
            throw FileError(L"Cannot read directory \"/fake\".", L"Simulated counting failure.");
        return {fileCount_, fileCount_ * fileSize_};
    }

    std::function<void(size_t fileIndex)> onFile; //called before each file is processed
    bool failCounting = false;

private:
    void runImpl(bool preview) override //throw CancelProcess, X
    {
        const DirectoryHandle dir = fs_.ref().getDirectoryHandle(Zstr("/fake/") + utfTo<Zstring>(getName()));

        for (size_t i = 0; i < fileCount_; ++i)
        {
            checkpoint(); //throw CancelProcess

            if (onFile)
                onFile(i);

            const FileHandle file = dir.getChildFile(numberTo<Zstring>(i) + Zstr(".txt"));
            events().createdFile.notify({file, dir, dir});
            if (!preview)
                addWrittenBytes(fileSize_);
            events().proceededFile.notify({file, fileSize_});
        }
    }

    const AfsDevice fs_ = makeSharedRef<NativeFileSystem>();
    const size_t fileCount_;
    const uint64_t fileSize_;
};


//records worker notifications in order of arrival
struct EventTrace
{
    explicit EventTrace(JobWorker& worker)
    {
        WorkerEvents& we = worker.events();
        we.started     .subscribe([this] { items.push_back(L"started"); });
        we.filesCounted.subscribe([this](const FileCounterResult& fc) { items.push_back(L"counted " + numberTo<std::wstring>(fc.countedFiles)); });
        we.jobStarted  .subscribe([this](const Job& job) { items.push_back(L"start "  + job.getName()); });
        we.jobFinished .subscribe([this](const Job& job) { items.push_back(L"finish " + job.getName()); });
        we.finished    .subscribe([this] { items.push_back(L"finished"); });
        we.createdFile .subscribe([this](const FileCopyEvent&) { ++createdFiles; });
    }

    size_t count(const std::wstring& item) const { return std::count(items.begin(), items.end(), item); }

    std::vector<std::wstring> items;
    size_t createdFiles = 0;
};


class JobWorkerTest : public ::testing::Test
{
protected:
    void SetUp() override { takeExtraLog(); }

    JobWorker worker_;
    EventTrace trace_{worker_};
};
}


TEST_F(JobWorkerTest, RunsJobsInSubmissionOrder)
{
    const std::vector<SharedRef<Job>> jobs
    {
        makeSharedRef<FakeJob>(L"A", 2),
        makeSharedRef<FakeJob>(L"B", 0),
        makeSharedRef<FakeJob>(L"C", 5),
    };

    worker_.start(jobs, false /*preview*/);

    const std::vector<std::wstring> expected
    {
        L"started",
        L"counted 7",
        L"start A",
        L"finish A",
        L"start B",
        L"finish B",
        L"start C",
        L"finish C",
        L"finished",
    };
    EXPECT_EQ(trace_.items, expected);

    EXPECT_EQ(worker_.getFileCounterResult(), (FileCounterResult{7, 700}));
    EXPECT_EQ(worker_.getProceededFiles(), 7u);
    EXPECT_EQ(worker_.getTotalWrittenBytes(), 700u);
    EXPECT_EQ(trace_.createdFiles, 7u);
    EXPECT_FALSE(worker_.isRunning());
}


TEST_F(JobWorkerTest, WrittenBytesIsSumOverJobs)
{
    const SharedRef<FakeJob> jobA = makeSharedRef<FakeJob>(L"A", 3, 1000);
    const SharedRef<FakeJob> jobB = makeSharedRef<FakeJob>(L"B", 2, 7);

    worker_.start({jobA, jobB}, false /*preview*/);

    EXPECT_EQ(jobA.ref().getWrittenBytes(), 3000u);
    EXPECT_EQ(jobB.ref().getWrittenBytes(), 14u);
    EXPECT_EQ(worker_.getTotalWrittenBytes(), 3014u);
}


TEST_F(JobWorkerTest, PreviewWritesNothing)
{
    worker_.start({makeSharedRef<FakeJob>(L"A", 3)}, true /*preview*/);

    EXPECT_EQ(worker_.getTotalWrittenBytes(), 0u);
    EXPECT_EQ(worker_.getProceededFiles(), 3u);
    EXPECT_EQ(trace_.count(L"finished"), 1u);
}


TEST_F(JobWorkerTest, ProceededFileIsRelayedBeforeCounting)
{
    std::vector<uint64_t> countersSeen;
    worker_.events().proceededFile.subscribe([&](const FileProceededEvent&) { countersSeen.push_back(worker_.getProceededFiles()); });

    worker_.start({makeSharedRef<FakeJob>(L"A", 2), makeSharedRef<FakeJob>(L"B", 2)}, false /*preview*/);

    EXPECT_EQ(countersSeen, (std::vector<uint64_t>{0, 1, 2, 3}));
    EXPECT_EQ(worker_.getProceededFiles(), 4u);
}


TEST_F(JobWorkerTest, StopDropsQueuedJobs)
{
    SharedRef<FakeJob> jobA = makeSharedRef<FakeJob>(L"A", 5);
    jobA.ref().onFile = [&](size_t fileIndex)
    {
        if (fileIndex == 2)
            worker_.stop();
    };

    worker_.start({jobA, makeSharedRef<FakeJob>(L"B", 3)}, false /*preview*/);

    //file #2 is still completed: stop is honored at the next checkpoint
    EXPECT_EQ(worker_.getProceededFiles(), 3u);

    EXPECT_EQ(trace_.count(L"start A"), 1u);
    EXPECT_EQ(trace_.count(L"finish A"), 0u);
    EXPECT_EQ(trace_.count(L"start B"), 0u);
    EXPECT_EQ(trace_.count(L"finished"), 0u);
    EXPECT_FALSE(worker_.isRunning());
}


TEST_F(JobWorkerTest, StopWithoutRunIsNoOp)
{
    worker_.stop();
    worker_.pause();
    EXPECT_FALSE(worker_.isPaused());
    worker_.resume();

    worker_.start({makeSharedRef<FakeJob>(L"A", 1)}, false /*preview*/);
    EXPECT_EQ(trace_.count(L"finished"), 1u);

    worker_.stop(); //after run
    EXPECT_FALSE(worker_.isRunning());
}


TEST_F(JobWorkerTest, CountingErrorContributesNothing)
{
    SharedRef<FakeJob> jobA = makeSharedRef<FakeJob>(L"A", 4);
    jobA.ref().failCounting = true;

    worker_.start({jobA, makeSharedRef<FakeJob>(L"B", 2)}, false /*preview*/);

    EXPECT_EQ(worker_.getFileCounterResult(), (FileCounterResult{2, 200}));
    EXPECT_EQ(worker_.getProceededFiles(), 6u); //job still runs
    EXPECT_EQ(trace_.count(L"finished"), 1u);

    const ErrorLog log = takeExtraLog();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].type, MSG_TYPE_ERROR);
}


TEST_F(JobWorkerTest, StartWhileRunningIsContractViolation)
{
    SharedRef<FakeJob> jobA = makeSharedRef<FakeJob>(L"A", 1);
    jobA.ref().onFile = [&](size_t /*fileIndex*/)
    {
        EXPECT_TRUE(worker_.isRunning());
        std::future<void> ft = worker_.startAsync({makeSharedRef<FakeJob>(L"X", 1)}, false /*preview*/);
        EXPECT_THROW(ft.get(), std::logic_error);
    };

    worker_.start({jobA}, false /*preview*/);

    EXPECT_EQ(trace_.count(L"start X"), 0u);
    EXPECT_EQ(trace_.count(L"finished"), 1u);
}


TEST_F(JobWorkerTest, StartAsyncReportsCompletionViaFuture)
{
    std::future<void> ft = worker_.startAsync({makeSharedRef<FakeJob>(L"A", 3)}, false /*preview*/);
    ft.get();

    EXPECT_EQ(worker_.getProceededFiles(), 3u);
    EXPECT_EQ(trace_.count(L"finished"), 1u);
}


TEST_F(JobWorkerTest, PauseBlocksUntilResumed)
{
    std::promise<void> pausedSignal;
    SharedRef<FakeJob> jobA = makeSharedRef<FakeJob>(L"A", 3);
    jobA.ref().onFile = [&](size_t fileIndex)
    {
        if (fileIndex == 0)
        {
            worker_.pause();
            pausedSignal.set_value();
        }
    };

    std::future<void> ft = worker_.startAsync({jobA}, false /*preview*/);
    pausedSignal.get_future().wait();

    EXPECT_TRUE(worker_.isPaused());

    //file #0 completes, then the job waits at the next checkpoint
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (worker_.getProceededFiles() < 1 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));

    EXPECT_EQ(ft.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
    EXPECT_EQ(worker_.getProceededFiles(), 1u);

    worker_.resume();
    ft.get();

    EXPECT_FALSE(worker_.isPaused());
    EXPECT_EQ(worker_.getProceededFiles(), 3u);
    EXPECT_EQ(trace_.count(L"finished"), 1u);
}


TEST_F(JobWorkerTest, StopWhilePaused)
{
    std::promise<void> pausedSignal;
    SharedRef<FakeJob> jobA = makeSharedRef<FakeJob>(L"A", 3);
    jobA.ref().onFile = [&](size_t fileIndex)
    {
        if (fileIndex == 0)
        {
            worker_.pause();
            pausedSignal.set_value();
        }
    };

    std::future<void> ft = worker_.startAsync({jobA, makeSharedRef<FakeJob>(L"B", 1)}, false /*preview*/);
    pausedSignal.get_future().wait();

    worker_.stop();
    ft.get();

    EXPECT_EQ(trace_.count(L"start B"), 0u);
    EXPECT_EQ(trace_.count(L"finished"), 0u);
}


TEST_F(JobWorkerTest, WorkerIsReusable)
{
    worker_.start({makeSharedRef<FakeJob>(L"A", 2)}, false /*preview*/);
    worker_.start({makeSharedRef<FakeJob>(L"B", 1)}, false /*preview*/);

    EXPECT_EQ(worker_.getProceededFiles(), 1u);
    EXPECT_EQ(worker_.getTotalWrittenBytes(), 100u);
    EXPECT_EQ(worker_.getFileCounterResult(), (FileCounterResult{1, 100}));
    EXPECT_EQ(trace_.count(L"finished"), 2u);
}


TEST_F(JobWorkerTest, StopBeforeFirstJob)
{
    worker_.events().started.subscribe([&] { worker_.stop(); });

    std::future<void> ft = worker_.startAsync({makeSharedRef<FakeJob>(L"A", 2), makeSharedRef<FakeJob>(L"B", 1)}, false /*preview*/);
    ft.get();

    EXPECT_EQ(trace_.count(L"start A"), 0u);
    EXPECT_EQ(trace_.count(L"start B"), 0u);
    EXPECT_EQ(trace_.count(L"finished"), 0u);
    EXPECT_EQ(worker_.getProceededFiles(), 0u);
    EXPECT_FALSE(worker_.isRunning());
}


TEST_F(JobWorkerTest, StopAfterCounting)
{
    worker_.events().filesCounted.subscribe([&](const FileCounterResult&) { worker_.stop(); });

    worker_.start({makeSharedRef<FakeJob>(L"A", 2)}, false /*preview*/);

    EXPECT_EQ(trace_.count(L"counted 2"), 1u);
    EXPECT_EQ(trace_.count(L"start A"), 0u);
    EXPECT_EQ(trace_.count(L"finished"), 0u);
    EXPECT_EQ(worker_.getProceededFiles(), 0u);
}


TEST_F(JobWorkerTest, StopIsNotLostWhileStarting)
{
    std::atomic<bool> stopIssued = false;
    std::thread stopper([&]
    {
        while (!worker_.isRunning())
            std::this_thread::yield();
        worker_.stop();
        stopIssued = true;
    });

    std::promise<void> stopSignal;
    SharedRef<FakeJob> jobA = makeSharedRef<FakeJob>(L"A", 1000);
    jobA.ref().onFile = [&](size_t /*fileIndex*/)
    {
        while (!stopIssued)
            std::this_thread::yield();
    };

    worker_.start({jobA, makeSharedRef<FakeJob>(L"B", 1)}, false /*preview*/);
    stopper.join();

    //isRunning() was true => the run was fully set up, so the stop must take effect
    EXPECT_LE(worker_.getProceededFiles(), 1u);
    EXPECT_EQ(trace_.count(L"start B"), 0u);
    EXPECT_EQ(trace_.count(L"finished"), 0u);
}


TEST_F(JobWorkerTest, DuplicateJobIsContractViolation)
{
    const SharedRef<FakeJob> jobA = makeSharedRef<FakeJob>(L"A", 2);

    EXPECT_THROW(worker_.start({jobA, jobA}, false /*preview*/), std::logic_error);
    EXPECT_TRUE(trace_.items.empty());
    EXPECT_FALSE(worker_.isRunning());

    const SharedRef<FakeJob> jobB = makeSharedRef<FakeJob>(L"B", 2, 50);
    worker_.start({jobB}, false /*preview*/);
    EXPECT_EQ(worker_.getTotalWrittenBytes(), 100u);

    //second run of the same instance
    EXPECT_THROW(worker_.start({jobB}, false /*preview*/), std::logic_error);
    JobWorker otherWorker;
    EXPECT_THROW(otherWorker.start({jobB}, false /*preview*/), std::logic_error);

    EXPECT_EQ(trace_.count(L"finish B"), 1u);
    EXPECT_EQ(worker_.getTotalWrittenBytes(), 100u);
}
