// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef LOG_FILE_H_931726432167489732164
#define LOG_FILE_H_931726432167489732164

#include <chrono>
#include <zen/error_log.h>
#include "file_counter.h"
#include "return_codes.h"
#include "../afs/abstract.h"


namespace jsync
{
struct ProcessSummary
{
    std::chrono::system_clock::time_point startTime;
    SyncResult resultStatus = SyncResult::aborted;
    std::vector<std::wstring> jobNames; //may be empty
    FileCounterResult statsProcessed; //files proceeded, bytes written
    FileCounterResult statsTotal;     //files counted, bytes counted
    std::chrono::milliseconds totalTime{};
};


//summary box followed by one line per log entry
std::string generateLogText(const ProcessSummary& summary, const zen::ErrorLog& log);

//"JobSync 2024-09-15 015052.log"; creates log folder if required
AbstractPath saveLogFile(const zen::ErrorLog& log, //throw FileError
                         const ProcessSummary& summary,
                         const AbstractPath& logFolderPath);
}

#endif //LOG_FILE_H_931726432167489732164
