// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "log_file.h"
#include <zen/file_io.h>
#include <zen/format_unit.h>
#include <zen/time.h>

using namespace zen;
using namespace jsync;
using AFS = AbstractFileSystem;


namespace
{
std::wstring generateLogHeader(const ProcessSummary& s, const ErrorLog& log)
{
    //assemble summary box
    std::vector<std::wstring> summary;

    const std::wstring tabSpace = TAB_SPACE;

    std::wstring headerLine = utfTo<std::wstring>(formatTime(formatIsoDateTimeTag, getLocalTime(std::chrono::system_clock::to_time_t(s.startTime))));
    for (const std::wstring& jobName : s.jobNames)
        headerLine += L"  " + jobName;

    summary.push_back(headerLine);
    summary.push_back(L"");
    summary.push_back(tabSpace + getFinalStatusLabel(s.resultStatus));

    const ErrorLogStats logCount = getStats(log);

    if (logCount.error   > 0) summary.push_back(tabSpace + _("Errors:")   + L' ' + formatNumber(logCount.error));
    if (logCount.warning > 0) summary.push_back(tabSpace + _("Warnings:") + L' ' + formatNumber(logCount.warning));

    summary.push_back(tabSpace + _("Jobs:") + L' ' + formatNumber(std::ssize(s.jobNames)));

    //show always, even if 0!
    summary.push_back(tabSpace + _("Items processed:") + L' ' + formatNumber(s.statsProcessed.countedFiles) +
                      L" (" + formatFilesizeShort(s.statsProcessed.countedBytes) + L')');

    if (s.statsProcessed.countedFiles < s.statsTotal.countedFiles)
        summary.push_back(tabSpace + _("Items remaining:") + L' ' + formatNumber(s.statsTotal.countedFiles - s.statsProcessed.countedFiles));

    summary.push_back(tabSpace + _("Bytes written:") + L' ' + formatFilesizeShort(s.statsProcessed.countedBytes));

    const int64_t totalTimeSec = std::chrono::duration_cast<std::chrono::seconds>(s.totalTime).count();
    summary.push_back(tabSpace + _("Total time:") + L' ' + utfTo<std::wstring>(formatTimeSpan(totalTimeSec)));

    size_t sepLineLen = 0;
    for (const std::wstring& str : summary) sepLineLen = std::max(sepLineLen, str.size());

    std::wstring output(sepLineLen + 1, L'_');
    output += L'\n';

    for (const std::wstring& str : summary) { output += L'|'; output += str; output += L'\n'; }

    output += L'|';
    output.append(sepLineLen, L'_');
    output += L'\n';

    return output;
}


void writeAll(AFS::OutputStream& streamOut, const std::string& buffer) //throw FileError
{
    for (size_t bytesWritten = 0; bytesWritten < buffer.size();)
        bytesWritten += streamOut.tryWrite(buffer.data() + bytesWritten, buffer.size() - bytesWritten); //throw FileError
}
}


std::string jsync::generateLogText(const ProcessSummary& summary, const ErrorLog& log)
{
    std::string output = utfTo<std::string>(generateLogHeader(summary, log));
    output += LINE_BREAK;

    for (const LogEntry& entry : log)
    {
        output += formatMessage(entry);
        output += LINE_BREAK;
    }
    return output;
}


AbstractPath jsync::saveLogFile(const ErrorLog& log, //throw FileError
                                const ProcessSummary& summary,
                                const AbstractPath& logFolderPath)
{
    //create logfile folder if required
    AFS::createFolderIfMissingRecursion(logFolderPath); //throw FileError

    //assemble logfile name
    const TimeComp tc = getLocalTime(std::chrono::system_clock::to_time_t(summary.startTime));
    if (tc == TimeComp())
        throw FileError(L"Failed to determine current time: " + numberTo<std::wstring>(summary.startTime.time_since_epoch().count()));

    const Zstring logFileName = Zstr("JobSync ") + formatTime(Zstr("%Y-%m-%d %H%M%S"), tc) + Zstr(".log");

    const AbstractPath logFilePath = AFS::appendRelPath(logFolderPath, logFileName);

    const std::string logText = generateLogText(summary, log);

    std::unique_ptr<AFS::OutputStream> logFileStream = AFS::getOutputStream(logFilePath, logText.size()); //throw FileError
    writeAll(*logFileStream, logText); //throw FileError
    logFileStream->finalize();         //throw FileError

    return logFilePath;
}
