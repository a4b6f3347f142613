// *****************************************************************************
// * This file is part of the JobSync project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIME_H_8457092814324342453627
#define TIME_H_8457092814324342453627

#include <ctime>
#include "zstring.h"


namespace zen
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getLocalTime(time_t utc); //convert time_t (UTC) to local time components, returns TimeComp() on error
TimeComp getLocalTime(); //utc = std::time()

/* format (current) date and time; example:
            formatTime(Zstr("%Y|%m|%d"));  -> "2011|10|29"
            formatTime(formatIsoDateTag);  -> "2011-10-29"
            formatTime(formatIsoTimeTag);  -> "17:55:34"                       */
Zstring formatTime(const Zchar* format, const TimeComp& tc = getLocalTime()); //format as specified by "std::strftime", returns empty string on error

const Zchar* const formatIsoTimeTag     = Zstr("%H:%M:%S");          //e.g. 14:55:02
const Zchar* const formatIsoDateTimeTag = Zstr("%Y-%m-%d %H:%M:%S"); //e.g. 2001-08-23 14:55:02

//format: [-][[d.]HH:]MM:SS    e.g. -1.23:45:67
Zstring formatTimeSpan(int64_t timeInSec);











//############################ implementation ##############################
inline
TimeComp getLocalTime(time_t utc)
{
    std::tm ctc = {};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    return
    {
        .year   = ctc.tm_year + 1900,
        .month  = ctc.tm_mon + 1,
        .day    = ctc.tm_mday,
        .hour   = ctc.tm_hour,
        .minute = ctc.tm_min,
        .second = ctc.tm_sec,
    };
}


inline
TimeComp getLocalTime()
{
    return getLocalTime(std::time(nullptr));
}


inline
Zstring formatTime(const Zchar* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getLocalTime()
        return Zstring();

    std::tm ctc =
    {
        .tm_sec   = tc.second,
        .tm_min   = tc.minute,
        .tm_hour  = tc.hour,
        .tm_mday  = tc.day,
        .tm_mon   = tc.month - 1,
        .tm_year  = tc.year - 1900,
        .tm_isdst = -1,
    };
    ::mktime(&ctc); //normalize: fill tm_wday, tm_yday

    Zchar buffer[256] = {};
    const size_t charsWritten = std::strftime(buffer, std::size(buffer), format, &ctc);
    return Zstring(buffer, charsWritten);
}


inline
Zstring formatTimeSpan(int64_t timeInSec)
{
    Zstring timespanStr;

    if (timeInSec < 0)
    {
        timespanStr = Zstr('-');
        timeInSec = -timeInSec;
    }

    const int64_t days = timeInSec / (24 * 3600);
    timeInSec %= 24 * 3600;

    if (days > 0)
        timespanStr += numberTo<Zstring>(days) + Zstr('.');

    timespanStr += printNumber<Zstring>("%02d", static_cast<int>(timeInSec / 3600)) + Zstr(':') +
                   printNumber<Zstring>("%02d", static_cast<int>(timeInSec / 60 % 60)) + Zstr(':') +
                   printNumber<Zstring>("%02d", static_cast<int>(timeInSec % 60));
    return timespanStr;
}
}

#endif //TIME_H_8457092814324342453627
