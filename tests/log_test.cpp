// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#include <gtest/gtest.h>
#include "test_utils.h"
#include "../JobSync/Source/base/log_file.h"
#include "../JobSync/Source/base/mirror_job.h"
#include "../JobSync/Source/base/run_logger.h"

using namespace zen;
using namespace jsync;
using namespace jsync::test;
using AFS = AbstractFileSystem;


namespace
{
ProcessSummary makeSummary()
{
    ProcessSummary summary;
    summary.startTime      = std::chrono::system_clock::now();
    summary.resultStatus   = SyncResult::finishedWarning;
    summary.jobNames       = {L"Documents", L"Music"};
    summary.statsProcessed = {2, 2048};
    summary.statsTotal     = {5, 4096};
    summary.totalTime      = std::chrono::milliseconds(65'000);
    return summary;
}


bool logHasMessage(const ErrorLog& log, MessageType type, const std::wstring& term)
{
    for (const LogEntry& entry : log)
        if (entry.type == type && contains(utfTo<std::wstring>(entry.message), term))
            return true;
    return false;
}


ptrdiff_t findMessage(const ErrorLog& log, const std::wstring& term) //-1 if not found
{
    for (auto it = log.begin(); it != log.end(); ++it)
        if (contains(utfTo<std::wstring>(it->message), term))
            return it - log.begin();
    return -1;
}
}


TEST(LogFile, SummaryHeader)
{
    ErrorLog log;
    logMsg(log, L"Starting jobs.", MSG_TYPE_INFO);
    logMsg(log, L"Something odd.", MSG_TYPE_WARNING);

    const std::string text = generateLogText(makeSummary(), log);

    EXPECT_TRUE(contains(text, "Documents  Music"));
    EXPECT_TRUE(contains(text, "Completed with warnings"));
    EXPECT_TRUE(contains(text, "Warnings: 1"));
    EXPECT_FALSE(contains(text, "Errors:"));
    EXPECT_TRUE(contains(text, "Jobs: 2"));
    EXPECT_TRUE(contains(text, "Items processed: 2"));
    EXPECT_TRUE(contains(text, "Items remaining: 3"));
    EXPECT_TRUE(contains(text, "Total time: 00:01:05"));
    EXPECT_TRUE(contains(text, "Starting jobs."));
    EXPECT_TRUE(contains(text, "Something odd."));
}


TEST(LogFile, SaveCreatesFolder)
{
    TempFolder tmp;
    const AfsDevice nativeFs = makeSharedRef<NativeFileSystem>();

    ErrorLog log;
    logMsg(log, L"Finished all jobs.", MSG_TYPE_INFO);
    const ProcessSummary summary = makeSummary();

    const AbstractPath logFilePath = saveLogFile(log, summary, nativeFs.ref().getDirectoryHandle(tmp / "logs/jobsync").getPath());

    const Zstring fileName = AFS::getItemName(logFilePath);
    EXPECT_TRUE(startsWith(fileName, "JobSync "));
    EXPECT_TRUE(endsWith(fileName, ".log"));

    EXPECT_EQ(readFile(tmp / ("logs/jobsync/" + fileName)), generateLogText(summary, log));
}


TEST(LogFile, SaveFailsForInvalidFolder)
{
    TempFolder tmp;
    writeFile(tmp / "file", "x");
    const AfsDevice nativeFs = makeSharedRef<NativeFileSystem>();

    EXPECT_THROW(saveLogFile(ErrorLog(), makeSummary(), nativeFs.ref().getDirectoryHandle(tmp / "file/logs").getPath()), FileError);
}


TEST(RunLogger, RecordsWorkerNotifications)
{
    takeExtraLog();
    TempFolder tmp;
    writeFile(tmp / "src/a.txt", "a");
    writeFile(tmp / "src/sub/b.txt", "b");
    writeFile(tmp / "dst/old.txt", "old");
    writeFile(tmp / "dst/oldDir/x.txt", "x");

    const AfsDevice nativeFs = makeSharedRef<NativeFileSystem>();

    JobWorker worker;
    RunLogger logger(worker);

    worker.start({makeSharedRef<MirrorJob>(L"Backup", nativeFs.ref().getDirectoryHandle(tmp / "src"),
                                           nativeFs.ref().getDirectoryHandle(tmp / "dst"))}, false /*preview*/);

    const ErrorLog& log = logger.getLog();

    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_INFO, L"Starting jobs."));
    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_INFO, L"Finished file counting. Files: 2"));
    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_INFO, L"Proceeding job: Backup..."));
    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_INFO, L"File created: " + utfTo<std::wstring>(tmp / "src/a.txt") + L" -> " + utfTo<std::wstring>(tmp / "dst/a.txt")));
    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_INFO, L"Directory created: " + utfTo<std::wstring>(tmp / "src/sub") + L" -> " + utfTo<std::wstring>(tmp / "dst/sub")));
    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_INFO, L"File deleted: " + utfTo<std::wstring>(tmp / "dst/old.txt")));
    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_INFO, L"Directory deleted: " + utfTo<std::wstring>(tmp / "dst/oldDir")));
    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_INFO, L"Finished job: Backup"));
    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_INFO, L"Finished all jobs."));

    EXPECT_EQ(getStats(log).error, 0);
    EXPECT_TRUE(takeExtraLog().empty());
}


TEST(RunLogger, RecordsCopyErrors)
{
    takeExtraLog();
    TempFolder tmp;
    writeFile(tmp / "src/a.bin", makeTestData(500));
    createDirectory(tmp / "dst");

    const AfsDevice nativeFs  = makeSharedRef<NativeFileSystem>();
    const AfsDevice failingFs = makeSharedRef<FailingWriteFileSystem>(100);

    JobWorker worker;
    RunLogger logger(worker);

    worker.start({makeSharedRef<MirrorJob>(L"Backup", nativeFs .ref().getDirectoryHandle(tmp / "src"),
                                           failingFs.ref().getDirectoryHandle(tmp / "dst"))}, false /*preview*/);

    ErrorLog log = logger.getLog();
    append(log, takeExtraLog());

    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_ERROR, L"Cannot copy file"));
    EXPECT_TRUE(logHasMessage(log, MSG_TYPE_ERROR, L"Simulated disk failure."));
    EXPECT_EQ(getStats(log).error, 2);
}


TEST(RunLogger, BackendErrorsKeepChronologicalOrder)
{
    takeExtraLog();
    TempFolder tmp;
    writeFile(tmp / "src/a.bin", makeTestData(500));
    createDirectory(tmp / "dst");

    const AfsDevice nativeFs  = makeSharedRef<NativeFileSystem>();
    const AfsDevice failingFs = makeSharedRef<FailingWriteFileSystem>(100);

    JobWorker worker;
    RunLogger logger(worker);

    worker.start({makeSharedRef<MirrorJob>(L"Backup", nativeFs .ref().getDirectoryHandle(tmp / "src"),
                                           failingFs.ref().getDirectoryHandle(tmp / "dst"))}, false /*preview*/);

    const ErrorLog& log = logger.getLog();

    const ptrdiff_t posDetail   = findMessage(log, L"Simulated disk failure.");
    const ptrdiff_t posCopy     = findMessage(log, L"Cannot copy file");
    const ptrdiff_t posFinished = findMessage(log, L"Finished all jobs.");
    ASSERT_GE(posDetail, 0);
    ASSERT_GE(posCopy,   0);
    ASSERT_GE(posFinished, 0);

    EXPECT_LT(posDetail, posCopy);
    EXPECT_LT(posCopy, posFinished);
    EXPECT_TRUE(takeExtraLog().empty()); //already part of the run log
}
