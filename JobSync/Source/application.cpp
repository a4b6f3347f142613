// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <iostream>
#include <zen/extra_log.h>
#include <zen/file_io.h>
#include <zen/stl_tools.h>
#include "afs/native.h"
#include "base/config.h"
#include "base/log_file.h"
#include "base/mirror_job.h"
#include "base/run_logger.h"

using namespace zen;
using namespace jsync;


namespace
{
void printToConsole(const std::string& text)
{
    std::cout << text;
    std::cout.flush();
}


void printError(const std::wstring& msg)
{
    std::cerr << utfTo<std::string>(msg) << std::endl;
}


SyncResult getSyncResult(const ErrorLog& log)
{
    const ErrorLogStats logCount = getStats(log);
    if (logCount.error > 0)
        return SyncResult::finishedError;
    if (logCount.warning > 0)
        return SyncResult::finishedWarning;
    return SyncResult::finishedSuccess;
}


JsyncReturnCode runJobs(const Zstring& cfgFilePath)
{
    JobSyncConfig cfg;
    std::wstring warningMsg;
    try
    {
        readConfig(cfgFilePath, cfg, warningMsg); //throw FileError
    }
    catch (const FileError& e)
    {
        printError(e.toString());
        return JSYNC_RC_ABORTED;
    }

    const auto startTime = std::chrono::system_clock::now();
    const auto startTick = std::chrono::steady_clock::now();

    const AfsDevice nativeFs = makeSharedRef<NativeFileSystem>();

    std::vector<SharedRef<Job>> jobs;
    std::vector<std::wstring> jobNames;
    for (const JobConfig& jobCfg : cfg.jobs)
    {
        const std::wstring jobName = getJobName(jobCfg);
        jobs.push_back(makeSharedRef<MirrorJob>(jobName,
                                                nativeFs.ref().getDirectoryHandle(jobCfg.sourceFolderPath),
                                                nativeFs.ref().getDirectoryHandle(jobCfg.targetFolderPath)));
        jobNames.push_back(jobName);
    }

    JobWorker worker;
    RunLogger logger(worker);

    if (!warningMsg.empty())
        logMsg(logger.getLog(), warningMsg, MSG_TYPE_WARNING);

    if (cfg.preview)
        logMsg(logger.getLog(), _("Preview mode: no changes are made."), MSG_TYPE_INFO);

    worker.start(jobs, cfg.preview); //throw X

    ErrorLog& log = logger.getLog();
    append(log, fetchExtraLog()); //entries logged after the last notification, e.g. after stop()

    ProcessSummary summary;
    summary.startTime    = startTime;
    summary.resultStatus = getSyncResult(log);
    summary.jobNames     = jobNames;
    summary.statsProcessed = {worker.getProceededFiles(), worker.getTotalWrittenBytes()};
    summary.statsTotal     = worker.getFileCounterResult();
    summary.totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTick);

    printToConsole(generateLogText(summary, log));

    JsyncReturnCode rc = mapToReturnCode(summary.resultStatus);

    if (!cfg.logFolderPath.empty())
        try
        {
            const AbstractPath logFilePath = saveLogFile(log, summary, nativeFs.ref().getDirectoryHandle(cfg.logFolderPath).getPath()); //throw FileError
            printToConsole(utfTo<std::string>(_("Log file:") + L' ' + AbstractFileSystem::getDisplayPath(logFilePath)) + LINE_BREAK);
        }
        catch (const FileError& e)
        {
            printError(e.toString());
            raiseReturnCode(rc, JSYNC_RC_WARNING);
        }

    return rc;
}
}


int main(int argc, char* argv[])
{
    initExtraLog([](const ErrorLog& log) //nothrow! runs during global shutdown!
    {
        for (const LogEntry& entry : log)
            std::cerr << formatMessage(entry);
    });

    if (argc != 2)
    {
        printError(_("Syntax:") + L' ' + L"jobsync <config.xml>");
        return JSYNC_RC_ABORTED;
    }

    return runJobs(argv[1]);
}
