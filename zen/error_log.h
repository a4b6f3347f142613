// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_8917590832147915
#define ERROR_LOG_H_8917590832147915

#include <cassert>
#include <algorithm>
#include <vector>
#include "time.h"
#include "i18n.h"
#include "zstring.h"


namespace zen
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message; //UTF-8
};

std::string formatMessage(const LogEntry& entry);

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));

void append(ErrorLog& log, const ErrorLog& other); //keep chronological order

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);







//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    log.push_back({time, type, utfTo<std::string>(msg)});
}


inline
void append(ErrorLog& log, const ErrorLog& other)
{
    //entries of "other" with equal time stamp go after those already in "log"
    const auto itOther = log.insert(log.end(), other.begin(), other.end());
    std::inplace_merge(log.begin(), itOther, log.end(), [](const LogEntry& lhs, const LogEntry& rhs) { return lhs.time < rhs.time; });
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats stats;
    for (const LogEntry& entry : log)
        (entry.type == MSG_TYPE_ERROR   ? stats.error :
         entry.type == MSG_TYPE_WARNING ? stats.warning : stats.info) += 1;
    return stats;
}


inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return _("Info");
        case MSG_TYPE_WARNING:
            return _("Warning");
        case MSG_TYPE_ERROR:
            return _("Error");
    }
    assert(false);
    return std::wstring();
}


//"[14:55:02]  Error:  Cannot delete file "/tmp/a".
//                     ENOENT: No such file or directory [unlink]"
inline
std::string formatMessage(const LogEntry& entry)
{
    const std::string prefix = '[' + formatTime(formatIsoTimeTag, getLocalTime(entry.time)) + "]  " + utfTo<std::string>(getMessageTypeLabel(entry.type)) + ":  ";
    const std::string indent(unicodeLength(prefix), ' ');

    std::string output = prefix;
    bool firstLine = true;
    for (const std::string& line : splitCpy(trimCpy(entry.message), '\n'))
        if (!line.empty()) //blank lines are dropped
        {
            if (!firstLine)
                output += '\n' + indent;
            output += line;
            firstLine = false;
        }
    output += '\n';
    return output;
}
}

#endif //ERROR_LOG_H_8917590832147915
