// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The JobSync Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef RUN_LOGGER_H_2903457823904572390457
#define RUN_LOGGER_H_2903457823904572390457

#include <zen/error_log.h>
#include <zen/extra_log.h>
#include "job_worker.h"


namespace jsync
{
/*  turn worker notifications into log entries: subscribe before the run starts, read log after it ended
    - moves entries of the process-wide extra log into the run log as they occur  */
class RunLogger
{
public:
    explicit RunLogger(JobWorker& worker);

    const zen::ErrorLog& getLog() const { return log_; }
    /**/  zen::ErrorLog& getLog()       { return log_; }

private:
    RunLogger           (const RunLogger&) = delete;
    RunLogger& operator=(const RunLogger&) = delete;

    void logInfo (const std::wstring& msg) { takeExtraLog(); zen::logMsg(log_, msg, zen::MSG_TYPE_INFO); }
    void logError(const std::wstring& msg) { takeExtraLog(); zen::logMsg(log_, msg, zen::MSG_TYPE_ERROR); }

    //backend errors are logged before the notification reporting them
    void takeExtraLog() { zen::append(log_, zen::fetchExtraLog()); }

    zen::ErrorLog log_;
};
}

#endif //RUN_LOGGER_H_2903457823904572390457
