// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_601673246392441846218957402563
#define EXTRA_LOG_H_601673246392441846218957402563

#include <functional>
#include <utility>
#include "error_log.h"
#include "thread.h"

/*  process-wide error log for situations where errors cannot be propagated, e.g.
    - while an exception is in flight
    - cleanup errors
    - boolean "try" operations that report failure by return value only      */

namespace zen
{
namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog) { reportOutstandingLog_ = reportOutstandingLog; }

    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void logMessage(const std::wstring& msg, MessageType type) { logMsg(log_, msg, type); }

private:
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};


//one instance per process: inline function => shared across translation units
inline
Protected<ExtraLog>& getGlobalExtraLog()
{
    static Protected<ExtraLog> globalExtraLog; //thread-safe init since C++11
    return globalExtraLog;
}


template <class Function> inline
void accessExtraLog(Function fun)
{
    getGlobalExtraLog().access([&](ExtraLog& log) { fun(log); });
}
}

inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    ErrorLog output;
    impl::accessExtraLog([&](impl::ExtraLog& el) { output = el.fetchLog(); });
    return output;
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.logMessage(msg, MSG_TYPE_ERROR); });
}


inline
void logExtraWarning(const std::wstring& msg) //nothrow!
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.logMessage(msg, MSG_TYPE_WARNING); });
}
}

#endif //EXTRA_LOG_H_601673246392441846218957402563
